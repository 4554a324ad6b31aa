#pragma once

#include <string>
#include <utility>
#include <vector>

namespace umicheck {

enum class FileType {
    Fastq,
    FastqGz,
    Fasta,
    FastaGz,
    Bam,
    Sam
};

// Detect the input type from the (case-insensitive) file name suffix.
// Throws Error(InvalidArgument) for anything else.
FileType file_type_from_path(const std::string& path);

const char* file_type_name(FileType type);

inline bool is_alignment_type(FileType type) {
    return type == FileType::Bam || type == FileType::Sam;
}

struct OutputPaths {
    std::string kept;
    std::string removed;
};

/**
 * Output paths for a prefix: "<base>.<ext>" and "<base>.removed.<ext>",
 * where <ext> is the canonical suffix of `type` (fq, fq.gz, fa, fa.gz,
 * bam, sam) and
 * <base> is the prefix with one accepted suffix variant stripped.
 */
OutputPaths build_output_paths(FileType type, const std::string& prefix);

}  // namespace umicheck
