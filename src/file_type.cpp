#include "umicheck/file_type.hpp"
#include "umicheck/error.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace umicheck {

namespace {

struct SuffixInfo {
    const char* canonical;
    std::vector<std::string> variants;
};

SuffixInfo suffix_info(FileType type) {
    switch (type) {
        case FileType::Fastq:   return {"fq", {".fq", ".fastq"}};
        case FileType::FastqGz: return {"fq.gz", {".fq.gz", ".fastq.gz"}};
        case FileType::Fasta:   return {"fa", {".fa", ".fasta"}};
        case FileType::FastaGz: return {"fa.gz", {".fa.gz", ".fasta.gz"}};
        case FileType::Bam:     return {"bam", {".bam"}};
        case FileType::Sam:     return {"sam", {".sam"}};
    }
    return {"", {}};
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

FileType file_type_from_path(const std::string& path) {
    std::string name = std::filesystem::path(path).filename().string();
    if (name.empty()) {
        throw Error(ErrorKind::InvalidArgument, "Invalid file name: " + path);
    }
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ends_with(name, ".fq.gz") || ends_with(name, ".fastq.gz")) {
        return FileType::FastqGz;
    }
    if (ends_with(name, ".fq") || ends_with(name, ".fastq")) {
        return FileType::Fastq;
    }
    if (ends_with(name, ".fa.gz") || ends_with(name, ".fasta.gz")) {
        return FileType::FastaGz;
    }
    if (ends_with(name, ".fa") || ends_with(name, ".fasta")) {
        return FileType::Fasta;
    }
    if (ends_with(name, ".bam")) {
        return FileType::Bam;
    }
    if (ends_with(name, ".sam")) {
        return FileType::Sam;
    }
    throw Error(ErrorKind::InvalidArgument, "Unsupported file type: " + name);
}

const char* file_type_name(FileType type) {
    switch (type) {
        case FileType::Fastq:   return "FASTQ";
        case FileType::FastqGz: return "FASTQ.gz";
        case FileType::Fasta:   return "FASTA";
        case FileType::FastaGz: return "FASTA.gz";
        case FileType::Bam:     return "BAM";
        case FileType::Sam:     return "SAM";
    }
    return "unknown";
}

OutputPaths build_output_paths(FileType type, const std::string& prefix) {
    const SuffixInfo info = suffix_info(type);

    std::string base = prefix;
    for (const auto& variant : info.variants) {
        if (ends_with(base, variant)) {
            base.erase(base.size() - variant.size());
            break;
        }
    }

    OutputPaths paths;
    paths.kept = base + "." + info.canonical;
    paths.removed = base + ".removed." + info.canonical;
    return paths;
}

}  // namespace umicheck
