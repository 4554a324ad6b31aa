// Unit tests for input type detection and output path construction

#include "umicheck/error.hpp"
#include "umicheck/file_type.hpp"
#include <cassert>
#include <iostream>
#include <string>

using umicheck::FileType;

static bool rejects(const std::string& path) {
    try {
        (void)umicheck::file_type_from_path(path);
    } catch (const umicheck::Error& e) {
        return e.kind() == umicheck::ErrorKind::InvalidArgument;
    }
    return false;
}

void test_detection() {
    std::cout << "Testing file type detection... ";
    assert(umicheck::file_type_from_path("reads.fq") == FileType::Fastq);
    assert(umicheck::file_type_from_path("reads.fastq") == FileType::Fastq);
    assert(umicheck::file_type_from_path("reads.fq.gz") == FileType::FastqGz);
    assert(umicheck::file_type_from_path("reads.fastq.gz") == FileType::FastqGz);
    assert(umicheck::file_type_from_path("aln.bam") == FileType::Bam);
    assert(umicheck::file_type_from_path("aln.sam") == FileType::Sam);
    assert(umicheck::file_type_from_path("/data/run.1/reads.fq") == FileType::Fastq);
    std::cout << "PASSED\n";
}

void test_case_insensitive() {
    std::cout << "Testing case-insensitive suffixes... ";
    assert(umicheck::file_type_from_path("READS.FASTQ.GZ") == FileType::FastqGz);
    assert(umicheck::file_type_from_path("Aln.BAM") == FileType::Bam);
    assert(umicheck::file_type_from_path("x.Fq") == FileType::Fastq);
    std::cout << "PASSED\n";
}

void test_fasta_names() {
    std::cout << "Testing FASTA names... ";
    assert(umicheck::file_type_from_path("contigs.fa") == FileType::Fasta);
    assert(umicheck::file_type_from_path("contigs.fasta") == FileType::Fasta);
    assert(umicheck::file_type_from_path("contigs.fa.gz") == FileType::FastaGz);
    assert(umicheck::file_type_from_path("CONTIGS.FASTA.GZ") == FileType::FastaGz);
    assert(!umicheck::is_alignment_type(FileType::Fasta));
    std::cout << "PASSED\n";
}

void test_unsupported() {
    std::cout << "Testing unsupported names... ";
    assert(rejects("reads.txt"));
    assert(rejects("reads.gz"));
    assert(rejects("reads.cram"));
    assert(rejects("fq"));
    assert(rejects("dir/"));
    std::cout << "PASSED\n";
}

void test_type_names() {
    std::cout << "Testing type names... ";
    assert(std::string(umicheck::file_type_name(FileType::Fastq)) == "FASTQ");
    assert(std::string(umicheck::file_type_name(FileType::FastqGz)) == "FASTQ.gz");
    assert(std::string(umicheck::file_type_name(FileType::Fasta)) == "FASTA");
    assert(std::string(umicheck::file_type_name(FileType::FastaGz)) == "FASTA.gz");
    assert(std::string(umicheck::file_type_name(FileType::Bam)) == "BAM");
    assert(std::string(umicheck::file_type_name(FileType::Sam)) == "SAM");
    assert(umicheck::is_alignment_type(FileType::Sam));
    assert(!umicheck::is_alignment_type(FileType::FastqGz));
    std::cout << "PASSED\n";
}

void test_output_paths() {
    std::cout << "Testing output paths... ";
    auto p = umicheck::build_output_paths(FileType::Fastq, "out");
    assert(p.kept == "out.fq");
    assert(p.removed == "out.removed.fq");

    p = umicheck::build_output_paths(FileType::Fastq, "out.fastq");
    assert(p.kept == "out.fq");
    assert(p.removed == "out.removed.fq");

    p = umicheck::build_output_paths(FileType::FastqGz, "dir/sample.fq.gz");
    assert(p.kept == "dir/sample.fq.gz");
    assert(p.removed == "dir/sample.removed.fq.gz");

    p = umicheck::build_output_paths(FileType::FastqGz, "sample.fastq.gz");
    assert(p.kept == "sample.fq.gz");

    p = umicheck::build_output_paths(FileType::Fasta, "contigs.fasta");
    assert(p.kept == "contigs.fa");
    assert(p.removed == "contigs.removed.fa");

    p = umicheck::build_output_paths(FileType::FastaGz, "out/contigs");
    assert(p.kept == "out/contigs.fa.gz");
    assert(p.removed == "out/contigs.removed.fa.gz");

    p = umicheck::build_output_paths(FileType::Bam, "aln.bam");
    assert(p.kept == "aln.bam");
    assert(p.removed == "aln.removed.bam");

    p = umicheck::build_output_paths(FileType::Sam, "aln");
    assert(p.kept == "aln.sam");
    assert(p.removed == "aln.removed.sam");

    // Only a suffix of the input's own type is stripped
    p = umicheck::build_output_paths(FileType::Bam, "aln.fq");
    assert(p.kept == "aln.fq.bam");
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== File Type Tests ===\n\n";
    test_detection();
    test_case_insensitive();
    test_fasta_names();
    test_unsupported();
    test_type_names();
    test_output_paths();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
