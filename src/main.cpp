// umicheck: split reads by whether the UMI from their header occurs in
// their own sequence.
//
// Usage:
//   umicheck -i reads.fq.gz -o filtered -m 1
//
// Prints one tab-separated summary line to stdout:
//   file  total  kept  kept%  removed  removed%

#include "cli/args.hpp"
#include "umicheck/error.hpp"
#include "umicheck/file_type.hpp"
#include "umicheck/log_utils.hpp"
#include "umicheck/pipeline.hpp"
#include "umicheck/version.h"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

std::string display_name(const std::string& path) {
    std::string name = std::filesystem::path(path).filename().string();
    return name.empty() ? path : name;
}

}  // namespace

int main(int argc, char* argv[]) {
    umicheck::cli::Options opts;
    try {
        opts = umicheck::cli::parse_args(argc, argv);
    } catch (const umicheck::cli::ParseArgsExit& e) {
        if (e.exit_code() != 0) {
            std::cerr << e.what() << "\n";
            std::cerr << "Run '" << argv[0] << " --help' for usage information.\n";
        }
        return e.exit_code();
    }

    try {
        const umicheck::FileType file_type = umicheck::file_type_from_path(opts.input_file);

        umicheck::OutputPaths outputs;
        if (!opts.output_prefix.empty()) {
            outputs = umicheck::build_output_paths(file_type, opts.output_prefix);
        }

        umicheck::FilterParams params;
        params.max_mismatches = opts.mismatches;
        params.umi_length = opts.umi_length;
        params.batch_size = opts.batch_size;
        params.num_threads = opts.num_threads;
        params.length_mismatch = opts.skip_bad_umi
            ? umicheck::UmiMismatchPolicy::Skip
            : umicheck::UmiMismatchPolicy::Abort;

#ifndef _OPENMP
        params.num_threads = 1;
#endif

        if (opts.verbose) {
            std::cerr << "umicheck v" << UMICHECK_VERSION << "\n";
            std::cerr << "Input: " << opts.input_file
                      << " (" << umicheck::file_type_name(file_type) << ")\n";
            if (outputs.kept.empty()) {
                std::cerr << "Output: none\n";
            } else {
                std::cerr << "Output: " << outputs.kept << ", " << outputs.removed << "\n";
            }
            std::cerr << "UMI length: " << params.umi_length
                      << " | Mismatches: " << params.max_mismatches << "\n";
            std::cerr << "Threads: " << params.num_threads
                      << " | Batch size: " << params.batch_size << "\n";
            if (opts.skip_bad_umi) std::cerr << "Wrong-length UMIs: kept\n";
        }

        auto start = std::chrono::steady_clock::now();

        umicheck::FilterStats stats = umicheck::is_alignment_type(file_type)
            ? umicheck::process_bam(opts.input_file, outputs.kept, outputs.removed, params)
            : umicheck::process_fastq(opts.input_file, outputs.kept, outputs.removed, params);

        auto end = std::chrono::steady_clock::now();

        std::cout << display_name(opts.input_file) << "\t"
                  << stats.total << "\t"
                  << stats.kept << "\t"
                  << umicheck::log_utils::format_percent(stats.kept_percent()) << "\t"
                  << stats.removed << "\t"
                  << umicheck::log_utils::format_percent(stats.removed_percent()) << "\n";

        if (opts.verbose) {
            std::cerr << "Reads: " << umicheck::log_utils::format_count(stats.total)
                      << " | kept " << umicheck::log_utils::format_count(stats.kept)
                      << " | removed " << umicheck::log_utils::format_count(stats.removed) << "\n";
            std::cerr << "Elapsed: " << umicheck::log_utils::format_elapsed(start, end) << "\n";
        }
    } catch (const umicheck::Error& e) {
        std::cerr << "Error (" << umicheck::error_kind_name(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
