#ifndef UMICHECK_CLI_ARGS_HPP
#define UMICHECK_CLI_ARGS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>
#include <cstdint>

namespace umicheck {
namespace cli {

constexpr uint32_t kMaxMismatches = 3;

struct Options {
    std::string input_file;
    std::string output_prefix;        // Empty: no output files are written
    uint32_t mismatches = 0;          // Allowed mismatches when searching the UMI (<= 3)
    size_t umi_length = 12;           // Expected UMI length in bases
    int num_threads = 4;
    size_t batch_size = 10000;        // Records per parallel batch
    bool skip_bad_umi = false;        // Wrong-length UMI counts as "no UMI" instead of failing
    bool verbose = false;
};

// Thrown instead of calling exit() so parsing stays testable.
// Code 0 for --help/--version, 1 for usage errors.
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int exit_code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

// Print version string to stdout
void print_version();

// Print usage/help to stdout
void print_usage(const char* program_name);

// Parse command-line arguments into Options struct
Options parse_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace umicheck

#endif  // UMICHECK_CLI_ARGS_HPP
