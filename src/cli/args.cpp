#include "args.hpp"
#include "umicheck/version.h"
#include <iostream>
#include <string>

namespace umicheck {
namespace cli {

void print_version() {
    std::cout << "umicheck " << UMICHECK_VERSION << "\n";
}

void print_usage(const char* program_name) {
    std::cout << "umicheck v" << UMICHECK_VERSION
              << " - checks whether the header UMI occurs in the read sequence\n\n";
    std::cout << "Usage: " << program_name << " -i <input> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -i, --input <file>       Input FASTQ/FASTA (optionally .gz), BAM or SAM file\n";
    std::cout << "  -m, --mismatches <int>   Mismatches allowed when finding the UMI (0-3, default: 0)\n";
    std::cout << "  -l, --umi-length <int>   UMI length in bases (default: 12)\n";
    std::cout << "  -o, --output <prefix>    Output prefix; suffix derived from the input\n";
    std::cout << "                           (no output files without it)\n";
    std::cout << "  -t, --threads <int>      Number of threads (default: 4)\n";
    std::cout << "  -b, --batch-size <int>   Records per batch (default: 10000)\n";
    std::cout << "  --skip-bad-umi           Keep reads whose header UMI has the wrong length\n";
    std::cout << "                           instead of failing\n";
    std::cout << "  -v, --verbose            Verbose output (settings, elapsed time)\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Output (stdout, tab-separated):\n";
    std::cout << "  file  total  kept  kept%  removed  removed%\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " -i reads.fq.gz -o filtered -m 1\n";
    std::cout << "  " << program_name << " -i aligned.bam -l 10 -t 8\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_size = [&](const std::string& flag, const std::string& value) -> size_t {
            if (value.empty() || value[0] == '-') {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
            size_t idx = 0;
            size_t parsed = 0;
            try {
                parsed = std::stoull(value, &idx);
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
            if (idx != value.size()) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
            return parsed;
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            size_t idx = 0;
            int parsed = 0;
            try {
                parsed = std::stoi(value, &idx);
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
            if (idx != value.size()) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
            return parsed;
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--input") {
            opts.input_file = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_prefix = require_value(arg);
        } else if (arg == "-m" || arg == "--mismatches") {
            size_t m = parse_size(arg, require_value(arg));
            if (m > kMaxMismatches) {
                throw ParseArgsExit(1, "Error: Maximum allowed mismatches is " +
                                       std::to_string(kMaxMismatches));
            }
            opts.mismatches = static_cast<uint32_t>(m);
        } else if (arg == "-l" || arg == "--umi-length") {
            opts.umi_length = parse_size(arg, require_value(arg));
            if (opts.umi_length < 1) {
                throw ParseArgsExit(1, "Error: --umi-length must be >= 1");
            }
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-b" || arg == "--batch-size") {
            opts.batch_size = parse_size(arg, require_value(arg));
            if (opts.batch_size < 1) {
                throw ParseArgsExit(1, "Error: --batch-size must be >= 1");
            }
        } else if (arg == "--skip-bad-umi") {
            opts.skip_bad_umi = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.input_file.empty()) {
        throw ParseArgsExit(1, "Error: No input file specified");
    }

    return opts;
}

}  // namespace cli
}  // namespace umicheck
