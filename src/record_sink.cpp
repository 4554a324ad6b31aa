#include "umicheck/record_sink.hpp"

#include <stdexcept>

namespace umicheck {

RecordSink::RecordSink(std::unique_ptr<SequenceWriter> writer)
    : writer_(std::move(writer)) {}

RecordSink::RecordSink(std::unique_ptr<BamWriter> writer)
    : writer_(std::move(writer)) {}

bool RecordSink::discards() const {
    return std::holds_alternative<std::monostate>(writer_);
}

void RecordSink::write(const SequenceRecord& record) {
    if (discards()) return;
    auto* seq = std::get_if<std::unique_ptr<SequenceWriter>>(&writer_);
    if (!seq) {
        throw std::logic_error("FASTA/FASTQ record sent to a BAM sink");
    }
    (*seq)->write(record);
}

void RecordSink::write(const BamRecord& record) {
    if (discards()) return;
    auto* bam = std::get_if<std::unique_ptr<BamWriter>>(&writer_);
    if (!bam) {
        throw std::logic_error("BAM record sent to a FASTA/FASTQ sink");
    }
    (*bam)->write(record);
}

void RecordSink::close() {
    if (auto* seq = std::get_if<std::unique_ptr<SequenceWriter>>(&writer_)) {
        (*seq)->close();
    } else if (auto* bam = std::get_if<std::unique_ptr<BamWriter>>(&writer_)) {
        (*bam)->close();
    }
}

}  // namespace umicheck
