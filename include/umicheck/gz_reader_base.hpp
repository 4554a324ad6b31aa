#pragma once
// Abstract gzip line reader, a virtual dispatch firewall for rapidgzip.
//
// GzLineReaderRapidgzip is defined in src/sequence_io_backend.cpp, the only
// TU that includes rapidgzip headers. All other TUs see only this interface.

#include <memory>
#include <string>
#include <cstddef>

namespace umicheck {

class GzLineReader {
public:
    static constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;  // 4 MB

    virtual ~GzLineReader() = default;

    // Read one line (without trailing newline) into `line`. Returns false on EOF.
    virtual bool readline(std::string& line) = 0;
};

// True if the file starts with the gzip magic bytes; the name is not consulted.
bool is_gzip_file(const std::string& path);

// Factory, implemented in src/sequence_io_backend.cpp.
// Returns nullptr when HAVE_RAPIDGZIP is not defined or the file is not
// gzip; the caller falls back to zlib.
std::unique_ptr<GzLineReader> make_gz_reader(const std::string& path);

}  // namespace umicheck
