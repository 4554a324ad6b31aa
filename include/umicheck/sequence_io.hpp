#pragma once

#include <iosfwd>
#include <memory>
#include <string>

namespace umicheck {

/**
 * Sequence record from a FASTA/FASTQ file.
 *
 * Owns its bytes, so a record outlives the read call that produced it and
 * can sit in a batch until it is written.
 */
struct SequenceRecord {
    std::string header;    // Full header line without the '@' or '>' marker
    std::string sequence;
    std::string quality;   // Empty for FASTA input
};

/**
 * FASTA/FASTQ file reader
 *
 * Supports:
 * - Uncompressed and gzip-compressed files (rapidgzip when built in, else zlib)
 * - FASTA (multi-line) and FASTQ formats, detected from the first record
 * - '\n' and "\r\n" line endings
 */
class SequenceReader {
public:
    using record_type = SequenceRecord;

    enum class Format { FASTA, FASTQ, UNKNOWN };

    /**
     * Open a sequence file. Throws Error(Io) if it cannot be opened and
     * Error(Format) if it has content that is neither FASTA nor FASTQ.
     */
    explicit SequenceReader(const std::string& filename);
    ~SequenceReader();

    /**
     * Read next sequence.
     * Returns false at end of stream; throws Error(Format) on a malformed
     * or truncated record.
     */
    bool read_next(SequenceRecord& record);

    // True when the (decompressed) stream holds no records at all.
    bool is_empty() const;

    Format get_format() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * FASTA/FASTQ writer
 *
 * FASTQ mode writes "@header\nsequence\n+\nquality\n" per record, FASTA
 * mode ">header\nsequence\n". A path ending in ".gz" is written
 * gzip-compressed through zlib.
 */
class SequenceWriter {
public:
    using Format = SequenceReader::Format;

    // Throws Error(InvalidArgument) for Format::UNKNOWN.
    explicit SequenceWriter(const std::string& filename, Format format = Format::FASTQ);

    // Writes into a caller-owned stream; the stream must outlive the writer.
    explicit SequenceWriter(std::ostream& out, Format format = Format::FASTQ);

    ~SequenceWriter();

    void write(const SequenceRecord& record);

    /**
     * Flush and close. Throws Error(Io) if buffered data cannot be written.
     */
    void close();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace umicheck
