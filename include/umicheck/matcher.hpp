#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace umicheck {

/**
 * Hamming distance between two equal-length sequences.
 *
 * A position counts as a mismatch when the bytes differ or when either byte
 * is an ambiguous base ('N' or 'n'), so "N" vs "N" is a mismatch.
 * Compares eight bytes per step using SWAR arithmetic on 64-bit words.
 *
 * Lengths must be equal. Debug builds assert; release builds compare the
 * common prefix only and never read past either view.
 */
size_t hamming_distance(std::string_view a, std::string_view b);

/**
 * Byte-at-a-time reference for hamming_distance(). Same contract, same result.
 */
size_t hamming_distance_naive(std::string_view a, std::string_view b);

/**
 * True if some window of `read` with the length of `umi` lies within
 * `max_mismatches` of `umi` (distance as in hamming_distance()).
 *
 * max_mismatches == 0 is an exact substring search. Otherwise the UMI is
 * split into max_mismatches + 1 chunks and the full distance is computed
 * only for windows where at least one chunk matches exactly.
 */
bool umi_in_read(std::string_view umi, std::string_view read, uint32_t max_mismatches);

// True if the sequence holds an 'N' or 'n'.
bool has_ambiguous_base(std::string_view seq);

}  // namespace umicheck
