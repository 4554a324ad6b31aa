#pragma once

#include "umicheck/bam_io.hpp"
#include "umicheck/error.hpp"
#include "umicheck/record_sink.hpp"
#include "umicheck/sequence_io.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace umicheck {

constexpr size_t kDefaultBatchSize = 10000;

// What to do with a record whose header token has the wrong length.
enum class UmiMismatchPolicy {
    Abort,  // fail the run with ErrorKind::UmiLengthMismatch
    Skip    // treat the record as having no UMI (kept)
};

struct FilterParams {
    uint32_t max_mismatches = 0;
    size_t umi_length = 12;
    size_t batch_size = kDefaultBatchSize;
    int num_threads = 1;
    UmiMismatchPolicy length_mismatch = UmiMismatchPolicy::Abort;
};

struct FilterStats {
    uint64_t total = 0;
    uint64_t kept = 0;
    uint64_t removed = 0;

    double kept_percent() const {
        return total > 0 ? 100.0 * static_cast<double>(kept) / static_cast<double>(total) : 0.0;
    }
    double removed_percent() const {
        return total > 0 ? 100.0 * static_cast<double>(removed) / static_cast<double>(total) : 0.0;
    }
};

// Per-record outcome of the compute phase.
enum class Verdict : uint8_t {
    Kept = 0,
    Removed = 1,
    BadUmiLength = 2
};

// Throws Error(InvalidArgument) for a zero batch size or thread count < 1.
void validate_params(const FilterParams& params);

// Extract the header UMI and search it in the sequence. Never throws on
// record content; a missing UMI yields Kept.
Verdict classify_record(std::string_view header, std::string_view sequence,
                        const FilterParams& params);

inline std::string_view record_header(const SequenceRecord& r) { return r.header; }
inline std::string_view record_sequence(const SequenceRecord& r) { return r.sequence; }
inline std::string_view record_header(const BamRecord& r) { return r.name; }
inline std::string_view record_sequence(const BamRecord& r) { return r.sequence; }

/**
 * Parallel compute phase: one verdict per record, index-aligned with the
 * batch. Workers share only the read-only batch and write disjoint slots.
 */
template <typename Record>
std::vector<Verdict> classify_batch(const std::vector<Record>& batch, const FilterParams& params) {
    std::vector<Verdict> verdicts(batch.size(), Verdict::Kept);

    #pragma omp parallel for num_threads(params.num_threads) schedule(static)
    for (size_t i = 0; i < batch.size(); ++i) {
        verdicts[i] = classify_record(record_header(batch[i]), record_sequence(batch[i]), params);
    }
    return verdicts;
}

// Throws Error(UmiLengthMismatch) naming the offending header.
void throw_umi_length_mismatch(std::string_view header, size_t expected_length);

/**
 * Classify a batch, then write it serially in input order: matched records
 * to `removed`, the rest to `kept`. Under UmiMismatchPolicy::Abort a bad
 * UMI length anywhere in the batch throws before any of it is written.
 */
template <typename Record>
void process_batch(const std::vector<Record>& batch,
                   RecordSink& kept,
                   RecordSink& removed,
                   const FilterParams& params,
                   FilterStats& stats) {
    if (batch.empty()) {
        return;
    }

    const std::vector<Verdict> verdicts = classify_batch(batch, params);

    if (params.length_mismatch == UmiMismatchPolicy::Abort) {
        for (size_t i = 0; i < batch.size(); ++i) {
            if (verdicts[i] == Verdict::BadUmiLength) {
                throw_umi_length_mismatch(record_header(batch[i]), params.umi_length);
            }
        }
    }

    for (size_t i = 0; i < batch.size(); ++i) {
        if (verdicts[i] == Verdict::Removed) {
            removed.write(batch[i]);
            ++stats.removed;
        } else {
            kept.write(batch[i]);
            ++stats.kept;
        }
    }
}

/**
 * Stream every record of `reader` through process_batch(), holding at most
 * params.batch_size records at a time.
 *
 * Reader needs `record_type` and `bool read_next(record_type&)`.
 */
template <typename Reader>
FilterStats run_pipeline(Reader& reader,
                         RecordSink& kept,
                         RecordSink& removed,
                         const FilterParams& params) {
    using Record = typename Reader::record_type;

    validate_params(params);

    FilterStats stats;
    std::vector<Record> batch;
    batch.reserve(params.batch_size);

    Record record;
    while (reader.read_next(record)) {
        ++stats.total;
        batch.push_back(std::move(record));
        record = Record();

        if (batch.size() >= params.batch_size) {
            process_batch(batch, kept, removed, params, stats);
            batch.clear();
        }
    }

    // Final partial batch (possibly empty)
    process_batch(batch, kept, removed, params, stats);
    return stats;
}

/**
 * Filter a FASTA/FASTQ(.gz) file. Empty output paths mean "do not write".
 * Outputs are written in the format detected in the input (FASTA or FASTQ).
 *
 * An empty input still creates the kept output when one is requested; the
 * removed output is then left uncreated.
 */
FilterStats process_fastq(const std::string& input,
                          const std::string& kept_out,
                          const std::string& removed_out,
                          const FilterParams& params);

/**
 * Filter a BAM/SAM file; outputs reuse the input header.
 */
FilterStats process_bam(const std::string& input,
                        const std::string& kept_out,
                        const std::string& removed_out,
                        const FilterParams& params);

}  // namespace umicheck
