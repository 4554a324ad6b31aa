#include "umicheck/matcher.hpp"

#include <algorithm>
#include <cassert>
#include <cstring>

namespace umicheck {

namespace {

constexpr uint64_t kLaneOnes  = 0x0101010101010101ULL;
constexpr uint64_t kLaneLow7  = 0x7F7F7F7F7F7F7F7FULL;
constexpr uint64_t kUpperN    = 0x4E4E4E4E4E4E4E4EULL;  // 'N' in every lane
constexpr uint64_t kLowerN    = 0x6E6E6E6E6E6E6E6EULL;  // 'n' in every lane

inline bool is_ambiguous(char c) {
    return c == 'N' || c == 'n';
}

inline size_t mismatch_at(char a, char b) {
    return (a != b || is_ambiguous(a) || is_ambiguous(b)) ? 1 : 0;
}

inline uint64_t load_word(const char* p) {
    uint64_t w;
    std::memcpy(&w, p, sizeof(w));
    return w;
}

// 0x80 in every lane of `v` that is zero, 0x00 elsewhere. Carry-free, so a
// zero lane never marks its neighbour.
inline uint64_t zero_lanes(uint64_t v) {
    const uint64_t t = (v & kLaneLow7) + kLaneLow7;
    return ~(t | v | kLaneLow7);
}

inline uint64_t ambiguous_lanes(uint64_t w) {
    return zero_lanes(w ^ kUpperN) | zero_lanes(w ^ kLowerN);
}

// Number of non-zero byte lanes in x.
inline size_t count_nonzero_lanes(uint64_t x) {
    x |= x >> 4;
    x |= x >> 2;
    x |= x >> 1;
    x &= kLaneOnes;
    return static_cast<size_t>((x * kLaneOnes) >> 56);
}

inline bool chunk_matches(const char* umi, const char* window, size_t start, size_t end) {
    return std::memcmp(umi + start, window + start, end - start) == 0;
}

}  // namespace

size_t hamming_distance(std::string_view a, std::string_view b) {
    assert(a.size() == b.size());
    const size_t n = std::min(a.size(), b.size());
    const char* pa = a.data();
    const char* pb = b.data();

    size_t dist = 0;
    size_t i = 0;
    for (; i + 8 <= n; i += 8) {
        const uint64_t x = load_word(pa + i);
        const uint64_t y = load_word(pb + i);
        dist += count_nonzero_lanes((x ^ y) | ambiguous_lanes(x) | ambiguous_lanes(y));
    }
    for (; i < n; ++i) {
        dist += mismatch_at(pa[i], pb[i]);
    }
    return dist;
}

size_t hamming_distance_naive(std::string_view a, std::string_view b) {
    assert(a.size() == b.size());
    const size_t n = std::min(a.size(), b.size());
    size_t dist = 0;
    for (size_t i = 0; i < n; ++i) {
        dist += mismatch_at(a[i], b[i]);
    }
    return dist;
}

bool has_ambiguous_base(std::string_view seq) {
    return std::any_of(seq.begin(), seq.end(), is_ambiguous);
}

bool umi_in_read(std::string_view umi, std::string_view read, uint32_t max_mismatches) {
    const size_t umi_len = umi.size();
    const size_t read_len = read.size();

    if (read_len < umi_len) {
        return false;
    }

    const size_t n_windows = read_len - umi_len + 1;

    if (max_mismatches == 0) {
        // An ambiguous base costs one mismatch even against itself.
        if (has_ambiguous_base(umi)) {
            return false;
        }
        return read.find(umi) != std::string_view::npos;
    }

    const size_t num_chunks = static_cast<size_t>(max_mismatches) + 1;

    if (umi_len < num_chunks) {
        for (size_t pos = 0; pos < n_windows; ++pos) {
            if (hamming_distance(umi, read.substr(pos, umi_len)) <= max_mismatches) {
                return true;
            }
        }
        return false;
    }

    // Pigeonhole: with at most max_mismatches errors spread over
    // max_mismatches + 1 chunks, one chunk of a qualifying window is exact.
    const size_t chunk_size = umi_len / num_chunks;
    const char* umi_data = umi.data();

    for (size_t pos = 0; pos < n_windows; ++pos) {
        const char* window = read.data() + pos;

        bool seeded = false;
        for (size_t c = 0; c < num_chunks && !seeded; ++c) {
            const size_t start = c * chunk_size;
            const size_t end = (c + 1 == num_chunks) ? umi_len : start + chunk_size;
            seeded = chunk_matches(umi_data, window, start, end);
        }

        if (seeded &&
            hamming_distance(umi, std::string_view(window, umi_len)) <= max_mismatches) {
            return true;
        }
    }
    return false;
}

}  // namespace umicheck
