#include "umicheck/bam_io.hpp"
#include "umicheck/error.hpp"

#ifdef HAVE_HTSLIB
#include <htslib/sam.h>
#endif

namespace umicheck {

#ifdef HAVE_HTSLIB

void BamRecordDeleter::operator()(bam1_t* b) const {
    bam_destroy1(b);
}

class BamReader::Impl {
public:
    std::string path_;
    samFile* fp_ = nullptr;
    sam_hdr_t* hdr_ = nullptr;

    ~Impl() {
        if (hdr_) sam_hdr_destroy(hdr_);
        if (fp_) sam_close(fp_);
    }
};

BamReader::BamReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    impl_->path_ = filename;
    impl_->fp_ = sam_open(filename.c_str(), "r");
    if (!impl_->fp_) {
        throw Error(ErrorKind::Io, "Failed to open BAM/SAM file: " + filename);
    }
    impl_->hdr_ = sam_hdr_read(impl_->fp_);
    if (!impl_->hdr_) {
        throw Error(ErrorKind::Format, "Failed to read BAM/SAM header: " + filename);
    }
}

BamReader::~BamReader() = default;

bool BamReader::read_next(BamRecord& record) {
    std::unique_ptr<bam1_t, BamRecordDeleter> b(bam_init1());
    if (!b) {
        throw Error(ErrorKind::Io, "Out of memory reading " + impl_->path_);
    }

    const int ret = sam_read1(impl_->fp_, impl_->hdr_, b.get());
    if (ret == -1) {
        return false;
    }
    if (ret < -1) {
        throw Error(ErrorKind::Format, "Corrupt BAM/SAM record in " + impl_->path_);
    }

    record.name.assign(bam_get_qname(b.get()));
    const int32_t len = b->core.l_qseq;
    const uint8_t* seq = bam_get_seq(b.get());
    record.sequence.resize(static_cast<size_t>(len));
    for (int32_t i = 0; i < len; ++i) {
        record.sequence[i] = seq_nt16_str[bam_seqi(seq, i)];
    }
    record.rec = std::move(b);
    return true;
}

class BamWriter::Impl {
public:
    std::string path_;
    samFile* fp_ = nullptr;
    sam_hdr_t* hdr_ = nullptr;  // borrowed from the reader

    ~Impl() {
        if (fp_) sam_close(fp_);
    }
};

static bool is_sam_path(const std::string& path) {
    return path.size() > 4 && path.compare(path.size() - 4, 4, ".sam") == 0;
}

BamWriter::BamWriter(const std::string& filename, const BamReader& header_source)
    : impl_(std::make_unique<Impl>()) {
    impl_->path_ = filename;
    impl_->hdr_ = header_source.impl_->hdr_;
    impl_->fp_ = sam_open(filename.c_str(), is_sam_path(filename) ? "w" : "wb");
    if (!impl_->fp_) {
        throw Error(ErrorKind::Io, "Failed to create " + filename);
    }
    if (sam_hdr_write(impl_->fp_, impl_->hdr_) < 0) {
        throw Error(ErrorKind::Io, "Failed to write header to " + filename);
    }
}

BamWriter::~BamWriter() = default;

void BamWriter::write(const BamRecord& record) {
    if (sam_write1(impl_->fp_, impl_->hdr_, record.rec.get()) < 0) {
        throw Error(ErrorKind::Io, "Failed to write BAM record to " + impl_->path_);
    }
}

void BamWriter::close() {
    if (!impl_->fp_) return;
    const int rc = sam_close(impl_->fp_);
    impl_->fp_ = nullptr;
    if (rc < 0) {
        throw Error(ErrorKind::Io, "Failed to close " + impl_->path_);
    }
}

#else  // !HAVE_HTSLIB

void BamRecordDeleter::operator()(bam1_t* b) const {
    (void)b;
}

class BamReader::Impl {};
class BamWriter::Impl {};

BamReader::BamReader(const std::string& filename) {
    throw Error(ErrorKind::Unsupported,
                "BAM/SAM input requires htslib, which this build lacks: " + filename);
}

BamReader::~BamReader() = default;

bool BamReader::read_next(BamRecord&) {
    return false;
}

BamWriter::BamWriter(const std::string& filename, const BamReader&) {
    throw Error(ErrorKind::Unsupported,
                "BAM/SAM output requires htslib, which this build lacks: " + filename);
}

BamWriter::~BamWriter() = default;

void BamWriter::write(const BamRecord&) {}

void BamWriter::close() {}

#endif  // HAVE_HTSLIB

}  // namespace umicheck
