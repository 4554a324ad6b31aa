#pragma once
// BAM/SAM records through htslib. Built without htslib (HAVE_HTSLIB unset),
// opening a BamReader throws Error(Unsupported); no other TU needs htslib
// headers.

#include <memory>
#include <string>

struct bam1_t;

namespace umicheck {

struct BamRecordDeleter {
    void operator()(bam1_t* b) const;
};

/**
 * One alignment record, owned. The query name and the decoded base string
 * are copied out so matching never touches htslib's packed encoding.
 */
struct BamRecord {
    std::unique_ptr<bam1_t, BamRecordDeleter> rec;
    std::string name;
    std::string sequence;
};

class BamReader {
public:
    using record_type = BamRecord;

    explicit BamReader(const std::string& filename);
    ~BamReader();

    // Returns false at end of file; throws Error(Format) on a corrupt record.
    bool read_next(BamRecord& record);

private:
    friend class BamWriter;
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Writer using the header of an open BamReader as template.
 * Paths ending in ".sam" get SAM text, anything else BAM.
 */
class BamWriter {
public:
    BamWriter(const std::string& filename, const BamReader& header_source);
    ~BamWriter();

    void write(const BamRecord& record);
    void close();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace umicheck
