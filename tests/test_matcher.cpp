// Unit tests for the Hamming distance and UMI window search
// Compile: g++ -std=c++20 -I../include -o test_matcher test_matcher.cpp ../src/matcher.cpp

#include "umicheck/matcher.hpp"
#include <cassert>
#include <iostream>
#include <random>
#include <string>

using umicheck::hamming_distance;
using umicheck::hamming_distance_naive;
using umicheck::umi_in_read;

namespace {

std::string random_seq(std::mt19937& rng, size_t len, const std::string& alphabet) {
    std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
    std::string s(len, 'A');
    for (char& c : s) c = alphabet[pick(rng)];
    return s;
}

size_t count_ambiguous(const std::string& s) {
    size_t n = 0;
    for (char c : s) n += (c == 'N' || c == 'n') ? 1 : 0;
    return n;
}

// Exhaustive reference for umi_in_read()
bool brute_force_in_read(const std::string& umi, const std::string& read, uint32_t max_mm) {
    if (read.size() < umi.size()) return false;
    for (size_t pos = 0; pos + umi.size() <= read.size(); ++pos) {
        if (hamming_distance_naive(umi, read.substr(pos, umi.size())) <= max_mm) return true;
    }
    return false;
}

}  // namespace

void test_distance_basic() {
    std::cout << "Testing distance basics... ";
    assert(hamming_distance("ACGTACGT", "ACGTACGT") == 0);
    assert(hamming_distance("", "") == 0);
    assert(hamming_distance("A", "C") == 1);
    assert(hamming_distance("ACGTACGTAC", "TGCATGCATG") == 10);
    // 'N' counts as mismatch in the tail as well
    assert(hamming_distance("ACGTNACGTA", "ACGTAACGTT") == 2);
    std::cout << "PASSED\n";
}

void test_distance_ambiguous() {
    std::cout << "Testing ambiguous bases... ";
    assert(hamming_distance("N", "N") == 1);
    assert(hamming_distance("n", "n") == 1);
    assert(hamming_distance("N", "n") == 1);
    assert(hamming_distance("NNNNNNNN", "NNNNNNNN") == 8);
    assert(hamming_distance("ACGTNCGTACGT", "ACGTNCGTACGT") == 1);
    assert(hamming_distance("ACGTACGTACGn", "ACGTACGTACGn") == 1);
    assert(hamming_distance("acgtacgt", "acgtacgt") == 0);
    // Case differs: ordinary byte mismatch
    assert(hamming_distance("ACGT", "acgt") == 4);
    std::cout << "PASSED\n";
}

void test_distance_matches_naive() {
    std::cout << "Testing word path against naive path... ";
    std::mt19937 rng(12345);
    const std::string alphabet = "ACGTNacgtn";
    for (int iter = 0; iter < 5000; ++iter) {
        size_t len = static_cast<size_t>(iter % 41);
        std::string a = random_seq(rng, len, alphabet);
        std::string b = random_seq(rng, len, alphabet);
        if (iter % 3 == 0) b = a;
        assert(hamming_distance(a, b) == hamming_distance_naive(a, b));
    }
    // Byte values around 'N'/'n' and high-bit bytes must not trip the lane masks
    const std::string tricky = std::string("MNOmno\x80\xff\x4d\x4f\x01\x00", 12);
    for (size_t i = 0; i < tricky.size(); ++i) {
        for (size_t j = 0; j < tricky.size(); ++j) {
            std::string a(16, tricky[i]);
            std::string b(16, tricky[j]);
            b[3] = tricky[(i + j) % tricky.size()];
            assert(hamming_distance(a, b) == hamming_distance_naive(a, b));
        }
    }
    std::cout << "PASSED\n";
}

void test_distance_properties() {
    std::cout << "Testing symmetry, self distance and single substitution... ";
    std::mt19937 rng(777);
    const std::string alphabet = "ACGTNn";
    for (int iter = 0; iter < 1000; ++iter) {
        size_t len = 1 + static_cast<size_t>(iter % 30);
        std::string a = random_seq(rng, len, alphabet);
        std::string b = random_seq(rng, len, alphabet);
        assert(hamming_distance(a, b) == hamming_distance(b, a));
        assert(hamming_distance(a, a) == count_ambiguous(a));

        // Substitute one non-ambiguous position with a different non-ambiguous base
        std::string c = a;
        for (size_t i = 0; i < len; ++i) {
            if (c[i] == 'N' || c[i] == 'n') continue;
            c[i] = (c[i] == 'A') ? 'C' : 'A';
            assert(hamming_distance(a, c) == hamming_distance(a, a) + 1);
            break;
        }
    }
    std::cout << "PASSED\n";
}

void test_umi_scenarios() {
    std::cout << "Testing UMI search scenarios... ";
    const std::string umi = "ACGTACGTACGT";
    assert(umi_in_read(umi, "GGGGACGTACGTACGTGGGG", 0));

    const std::string one_sub = "GGGGACGTACGAACGTGGGG";
    assert(!umi_in_read(umi, one_sub, 0));
    assert(umi_in_read(umi, one_sub, 1));

    // Window at the very start and very end
    assert(umi_in_read(umi, "ACGTACGTACGTTTTT", 0));
    assert(umi_in_read(umi, "TTTTACGTACGTACGT", 0));
    assert(umi_in_read(umi, umi, 0));

    assert(!umi_in_read(umi, "AAAAAAAA", 0));
    assert(!umi_in_read(umi, "AAAAAAAAAAAAAAAAAAAA", 3));
    std::cout << "PASSED\n";
}

void test_short_read() {
    std::cout << "Testing read shorter than UMI... ";
    for (uint32_t m = 0; m <= 3; ++m) {
        assert(!umi_in_read("ACGTACGTACGT", "ACGTACGTACG", m));
        assert(!umi_in_read("ACGT", "", m));
    }
    std::cout << "PASSED\n";
}

void test_ambiguous_windows() {
    std::cout << "Testing ambiguous bases in UMI and read... ";
    // An N in the UMI can never give distance 0
    assert(!umi_in_read("ACGTNCGT", "TTACGTNCGTTT", 0));
    assert(umi_in_read("ACGTNCGT", "TTACGTNCGTTT", 1));
    // N in the read window is a mismatch too
    assert(!umi_in_read("ACGTACGT", "TTACGTNCGTTT", 0));
    assert(umi_in_read("ACGTACGT", "TTACGTNCGTTT", 1));
    assert(!umi_in_read("NNNN", "NNNNNNNN", 3));
    std::cout << "PASSED\n";
}

void test_exact_equals_substring() {
    std::cout << "Testing zero mismatches equals substring search... ";
    std::mt19937 rng(4242);
    const std::string alphabet = "ACGT";
    for (int iter = 0; iter < 2000; ++iter) {
        std::string umi = random_seq(rng, 1 + iter % 6, alphabet);
        std::string read = random_seq(rng, static_cast<size_t>(iter % 25), alphabet);
        bool expected = read.find(umi) != std::string::npos;
        assert(umi_in_read(umi, read, 0) == expected);
    }
    std::cout << "PASSED\n";
}

void test_against_brute_force() {
    std::cout << "Testing chunked search against brute force... ";
    std::mt19937 rng(99);
    const std::string alphabet = "ACGTN";
    for (int iter = 0; iter < 4000; ++iter) {
        size_t umi_len = 1 + static_cast<size_t>(iter % 14);
        std::string umi = random_seq(rng, umi_len, "ACGT");
        std::string read = random_seq(rng, static_cast<size_t>(iter % 40), alphabet);
        // Plant a mutated copy of the UMI in half of the reads
        if (iter % 2 == 0 && read.size() >= umi_len) {
            size_t pos = rng() % (read.size() - umi_len + 1);
            std::string planted = umi;
            size_t muts = rng() % 4;
            for (size_t k = 0; k < muts; ++k) planted[rng() % umi_len] = alphabet[rng() % alphabet.size()];
            read.replace(pos, umi_len, planted);
        }
        for (uint32_t m = 0; m <= 3; ++m) {
            assert(umi_in_read(umi, read, m) == brute_force_in_read(umi, read, m));
        }
    }
    std::cout << "PASSED\n";
}

void test_monotonic() {
    std::cout << "Testing monotonic relaxation... ";
    std::mt19937 rng(2024);
    for (int iter = 0; iter < 2000; ++iter) {
        std::string umi = random_seq(rng, 6 + iter % 8, "ACGT");
        std::string read = random_seq(rng, 10 + iter % 30, "ACGTN");
        bool prev = false;
        for (uint32_t m = 0; m <= 4; ++m) {
            bool now = umi_in_read(umi, read, m);
            assert(!prev || now);
            prev = now;
        }
    }
    std::cout << "PASSED\n";
}

void test_short_umi_fallback() {
    std::cout << "Testing UMI shorter than chunk count... ";
    // 3 chunks requested for a 2-base UMI: every window gets a full distance
    assert(umi_in_read("AC", "GGGG", 2));
    assert(!umi_in_read("AC", "GGGG", 1));
    assert(umi_in_read("AC", "GGCG", 1));
    assert(umi_in_read("A", "T", 3));
    std::cout << "PASSED\n";
}

void test_chunk_remainder() {
    std::cout << "Testing last chunk absorbs remainder... ";
    // 13 bases, 2 mismatches: chunks of 4, 4, 5. Mismatches in chunks 0 and 1,
    // chunk 2 exact.
    const std::string umi = "AAAACCCCGGGGT";
    const std::string read = "TTTATAACGCCGGGGTTT";
    assert(umi_in_read(umi, read, 2));
    assert(!umi_in_read(umi, read, 1));
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Matcher Tests ===\n\n";
    test_distance_basic();
    test_distance_ambiguous();
    test_distance_matches_naive();
    test_distance_properties();
    test_umi_scenarios();
    test_short_read();
    test_ambiguous_windows();
    test_exact_equals_substring();
    test_against_brute_force();
    test_monotonic();
    test_short_umi_fallback();
    test_chunk_remainder();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
