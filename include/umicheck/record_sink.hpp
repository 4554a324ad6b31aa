#pragma once

#include "umicheck/bam_io.hpp"
#include "umicheck/sequence_io.hpp"

#include <memory>
#include <variant>

namespace umicheck {

/**
 * Destination for one output channel (kept or removed).
 *
 * Holds either nothing (discard every record), a FASTA/FASTQ writer or a BAM
 * writer. Records are written in the order presented.
 */
class RecordSink {
public:
    RecordSink() = default;
    explicit RecordSink(std::unique_ptr<SequenceWriter> writer);
    explicit RecordSink(std::unique_ptr<BamWriter> writer);

    RecordSink(RecordSink&&) = default;
    RecordSink& operator=(RecordSink&&) = default;

    bool discards() const;

    // Throws std::logic_error when the record kind does not fit the writer.
    void write(const SequenceRecord& record);
    void write(const BamRecord& record);

    // Flush and close the underlying writer; Error(Io) on failure.
    void close();

private:
    std::variant<std::monostate,
                 std::unique_ptr<SequenceWriter>,
                 std::unique_ptr<BamWriter>> writer_;
};

}  // namespace umicheck
