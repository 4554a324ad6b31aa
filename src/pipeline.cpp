#include "umicheck/pipeline.hpp"
#include "umicheck/matcher.hpp"
#include "umicheck/umi_extract.hpp"

#include <filesystem>
#include <system_error>

namespace umicheck {

void validate_params(const FilterParams& params) {
    if (params.batch_size == 0) {
        throw Error(ErrorKind::InvalidArgument, "Batch size must be at least 1");
    }
    if (params.num_threads < 1) {
        throw Error(ErrorKind::InvalidArgument, "Thread count must be at least 1");
    }
}

Verdict classify_record(std::string_view header, std::string_view sequence,
                        const FilterParams& params) {
    const UmiExtract umi = extract_umi(header, params.umi_length);
    switch (umi.status) {
        case UmiStatus::NotFound:
            return Verdict::Kept;
        case UmiStatus::LengthMismatch:
            return params.length_mismatch == UmiMismatchPolicy::Skip
                ? Verdict::Kept
                : Verdict::BadUmiLength;
        case UmiStatus::Found:
            break;
    }
    return umi_in_read(umi.umi, sequence, params.max_mismatches)
        ? Verdict::Removed
        : Verdict::Kept;
}

void throw_umi_length_mismatch(std::string_view header, size_t expected_length) {
    const UmiExtract umi = extract_umi(header, expected_length);
    throw Error(ErrorKind::UmiLengthMismatch,
                "UMI length does not match expected length: expected " +
                std::to_string(expected_length) + ", found " +
                std::to_string(umi.umi.size()) + " in header '" +
                std::string(header) + "'");
}

namespace {

// Records leave in the format they arrived in.
RecordSink open_sequence_sink(const std::string& path, SequenceReader::Format format) {
    if (path.empty()) {
        return RecordSink();
    }
    return RecordSink(std::make_unique<SequenceWriter>(path, format));
}

uint64_t input_size(const std::string& input) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(input, ec);
    if (ec) {
        throw Error(ErrorKind::Io, "Cannot read input file " + input + ": " + ec.message());
    }
    return static_cast<uint64_t>(size);
}

}  // namespace

FilterStats process_fastq(const std::string& input,
                          const std::string& kept_out,
                          const std::string& removed_out,
                          const FilterParams& params) {
    validate_params(params);

    // Empty input: only the kept artifact is created.
    auto finish_empty = [&kept_out]() {
        if (!kept_out.empty()) {
            SequenceWriter writer(kept_out);
            writer.close();
        }
        return FilterStats{};
    };

    if (input_size(input) == 0) {
        return finish_empty();
    }

    SequenceReader reader(input);
    if (reader.is_empty()) {
        return finish_empty();
    }

    RecordSink kept = open_sequence_sink(kept_out, reader.get_format());
    RecordSink removed = open_sequence_sink(removed_out, reader.get_format());

    const FilterStats stats = run_pipeline(reader, kept, removed, params);

    kept.close();
    removed.close();
    return stats;
}

FilterStats process_bam(const std::string& input,
                        const std::string& kept_out,
                        const std::string& removed_out,
                        const FilterParams& params) {
    validate_params(params);

    BamReader reader(input);

    RecordSink kept;
    if (!kept_out.empty()) {
        kept = RecordSink(std::make_unique<BamWriter>(kept_out, reader));
    }
    RecordSink removed;
    if (!removed_out.empty()) {
        removed = RecordSink(std::make_unique<BamWriter>(removed_out, reader));
    }

    const FilterStats stats = run_pipeline(reader, kept, removed, params);

    kept.close();
    removed.close();
    return stats;
}

}  // namespace umicheck
