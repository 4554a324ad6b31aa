#include "umicheck/sequence_io.hpp"
#include "umicheck/error.hpp"
#include "umicheck/gz_reader_base.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <ostream>
#include <zlib.h>

namespace umicheck {

// Large I/O buffer for better throughput
constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;

// SequenceReader implementation
class SequenceReader::Impl {
public:
    std::string path_;
    std::unique_ptr<GzLineReader> fast_gz_;  // rapidgzip backend, when built in
    gzFile gz_file_ = nullptr;
    std::ifstream file_;
    Format format_ = Format::UNKNOWN;
    bool empty_ = true;
    char buffer_[65536];
    std::string line_;
    std::string lookahead_line_;
    bool has_lookahead_ = false;

    void open(const std::string& filename) {
        path_ = filename;
        if (is_gzip_file(filename)) {
            fast_gz_ = make_gz_reader(filename);
            if (!fast_gz_) {
                gz_file_ = gzopen(filename.c_str(), "rb");
                if (!gz_file_) {
                    throw Error(ErrorKind::Io, "Failed to open file: " + filename);
                }
                gzbuffer(gz_file_, GZBUF_SIZE);
            }
        } else {
            file_.open(filename, std::ios::binary);
            if (!file_) {
                throw Error(ErrorKind::Io, "Failed to open file: " + filename);
            }
        }
        detect_format();
    }

    // First non-blank line decides the format and is kept as lookahead.
    void detect_format() {
        std::string first;
        while (getline(first)) {
            if (first.empty()) continue;
            empty_ = false;
            if (first[0] == '@') {
                format_ = Format::FASTQ;
            } else if (first[0] == '>') {
                format_ = Format::FASTA;
            } else {
                throw Error(ErrorKind::Format,
                            "Unrecognized sequence format (expected FASTA or FASTQ): " + path_);
            }
            lookahead_line_ = std::move(first);
            has_lookahead_ = true;
            return;
        }
    }

    bool gz_getline(std::string& line) {
        line.clear();
        while (true) {
            if (!gzgets(gz_file_, buffer_, sizeof(buffer_))) {
                int errnum = Z_OK;
                const char* msg = gzerror(gz_file_, &errnum);
                if (errnum == Z_ERRNO) {
                    throw Error(ErrorKind::Io, "Read failed for " + path_ + ": " + std::strerror(errno));
                }
                if (errnum != Z_OK) {
                    throw Error(ErrorKind::Format, "Corrupt gzip stream in " + path_ + ": " + msg);
                }
                return !line.empty();
            }
            const size_t len = std::strlen(buffer_);
            line.append(buffer_, len);
            if (len > 0 && line.back() == '\n') {
                line.pop_back();
                return true;
            }
            // Line longer than the buffer: keep reading
        }
    }

    bool getline(std::string& line) {
        bool ok;
        if (fast_gz_) {
            ok = fast_gz_->readline(line);
        } else if (gz_file_) {
            ok = gz_getline(line);
        } else {
            ok = static_cast<bool>(std::getline(file_, line));
            if (!ok && file_.bad()) {
                throw Error(ErrorKind::Io, "Read failed for " + path_);
            }
        }
        if (ok && !line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return ok;
    }

    // Next non-blank line, lookahead first.
    bool next_record_line(std::string& line) {
        if (has_lookahead_) {
            line = std::move(lookahead_line_);
            has_lookahead_ = false;
            return true;
        }
        while (getline(line)) {
            if (!line.empty()) return true;
        }
        return false;
    }

    void truncated(const std::string& header) const {
        throw Error(ErrorKind::Format,
                    "Truncated FASTQ record '" + header + "' in " + path_);
    }

    ~Impl() {
        if (gz_file_) gzclose(gz_file_);
    }
};

SequenceReader::SequenceReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    impl_->open(filename);
}

SequenceReader::~SequenceReader() = default;

bool SequenceReader::read_next(SequenceRecord& record) {
    if (impl_->format_ == Format::UNKNOWN) {
        return false;
    }

    std::string& line = impl_->line_;
    if (!impl_->next_record_line(line)) {
        return false;
    }

    if (impl_->format_ == Format::FASTQ) {
        if (line[0] != '@') {
            throw Error(ErrorKind::Format,
                        "Expected '@' at start of FASTQ record in " + impl_->path_ + ": " + line);
        }
        record.header.assign(line, 1, std::string::npos);

        if (!impl_->getline(record.sequence)) impl_->truncated(record.header);

        if (!impl_->getline(line)) impl_->truncated(record.header);
        if (line.empty() || line[0] != '+') {
            throw Error(ErrorKind::Format,
                        "Missing '+' separator in FASTQ record '" + record.header +
                        "' in " + impl_->path_);
        }

        if (!impl_->getline(record.quality)) {
            // Empty read as the last record, quality line without newline
            if (!record.sequence.empty()) impl_->truncated(record.header);
            record.quality.clear();
        }
        if (record.quality.size() != record.sequence.size()) {
            throw Error(ErrorKind::Format,
                        "Quality length differs from sequence length in FASTQ record '" +
                        record.header + "' in " + impl_->path_);
        }
        return true;
    }

    // FASTA: header, then sequence lines until the next header or EOF
    if (line[0] != '>') {
        throw Error(ErrorKind::Format,
                    "Expected '>' at start of FASTA record in " + impl_->path_ + ": " + line);
    }
    record.header.assign(line, 1, std::string::npos);
    record.sequence.clear();
    record.quality.clear();
    while (impl_->getline(line)) {
        if (line.empty()) continue;
        if (line[0] == '>') {
            impl_->lookahead_line_ = std::move(line);
            impl_->has_lookahead_ = true;
            break;
        }
        record.sequence += line;
    }
    return true;
}

bool SequenceReader::is_empty() const {
    return impl_->empty_;
}

SequenceReader::Format SequenceReader::get_format() const {
    return impl_->format_;
}

// SequenceWriter implementation
class SequenceWriter::Impl {
public:
    std::string path_;
    bool fasta_ = false;
    gzFile gz_ = nullptr;
    std::ofstream file_;
    std::ostream* out_ = nullptr;
    bool closed_ = false;
    static constexpr size_t BUFFER_SIZE = 1024 * 1024;  // 1MB buffer
    char buffer_[BUFFER_SIZE];

    void write(const char* data, size_t len) {
        if (len == 0) return;
        if (gz_) {
            if (gzwrite(gz_, data, static_cast<unsigned>(len)) != static_cast<int>(len)) {
                int errnum = Z_OK;
                const char* msg = gzerror(gz_, &errnum);
                throw Error(ErrorKind::Io, "Failed to write " + path_ + ": " + msg);
            }
            return;
        }
        out_->write(data, static_cast<std::streamsize>(len));
        if (!*out_) {
            throw Error(ErrorKind::Io, "Failed to write " + path_);
        }
    }

    void write(const std::string& str) {
        write(str.data(), str.size());
    }
};

static bool writes_fasta(SequenceWriter::Format format, const std::string& path) {
    if (format == SequenceWriter::Format::UNKNOWN) {
        throw Error(ErrorKind::InvalidArgument, "No output format given for " + path);
    }
    return format == SequenceWriter::Format::FASTA;
}

SequenceWriter::SequenceWriter(const std::string& filename, Format format)
    : impl_(std::make_unique<Impl>()) {
    impl_->path_ = filename;
    impl_->fasta_ = writes_fasta(format, filename);

    bool want_gzip = (filename.size() > 3 &&
                      filename.compare(filename.size() - 3, 3, ".gz") == 0);

    if (want_gzip) {
        impl_->gz_ = gzopen(filename.c_str(), "wb");
        if (!impl_->gz_) {
            throw Error(ErrorKind::Io, "Failed to create " + filename);
        }
        gzbuffer(impl_->gz_, GZBUF_SIZE);
        return;
    }

    impl_->file_.rdbuf()->pubsetbuf(impl_->buffer_, Impl::BUFFER_SIZE);
    impl_->file_.open(filename, std::ios::binary | std::ios::trunc);
    if (!impl_->file_) {
        throw Error(ErrorKind::Io, "Failed to create " + filename);
    }
    impl_->out_ = &impl_->file_;
}

SequenceWriter::SequenceWriter(std::ostream& out, Format format)
    : impl_(std::make_unique<Impl>()) {
    impl_->path_ = "<stream>";
    impl_->fasta_ = writes_fasta(format, impl_->path_);
    impl_->out_ = &out;
}

SequenceWriter::~SequenceWriter() {
    // close() is the checked path; reaching here unclosed means the run
    // is already failing.
    if (impl_ && impl_->gz_) {
        gzclose(impl_->gz_);
    }
}

void SequenceWriter::write(const SequenceRecord& record) {
    if (impl_->fasta_) {
        impl_->write(">", 1);
        impl_->write(record.header);
        impl_->write("\n", 1);
        impl_->write(record.sequence);
        impl_->write("\n", 1);
        return;
    }
    impl_->write("@", 1);
    impl_->write(record.header);
    impl_->write("\n", 1);
    impl_->write(record.sequence);
    impl_->write("\n+\n", 3);
    impl_->write(record.quality);
    impl_->write("\n", 1);
}

void SequenceWriter::close() {
    if (impl_->closed_) return;
    impl_->closed_ = true;

    if (impl_->gz_) {
        const int rc = gzclose(impl_->gz_);
        impl_->gz_ = nullptr;
        if (rc != Z_OK) {
            throw Error(ErrorKind::Io, "Failed to close " + impl_->path_);
        }
    } else if (impl_->file_.is_open()) {
        impl_->file_.close();
        if (impl_->file_.fail()) {
            throw Error(ErrorKind::Io, "Failed to close " + impl_->path_);
        }
    } else if (impl_->out_) {
        impl_->out_->flush();
        if (!*impl_->out_) {
            throw Error(ErrorKind::Io, "Failed to flush " + impl_->path_);
        }
    }
}

}  // namespace umicheck
