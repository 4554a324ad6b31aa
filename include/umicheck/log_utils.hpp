#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace umicheck {
namespace log_utils {

// "1.234s"
inline std::string format_seconds(double seconds) {
    if (seconds < 0.0) seconds = 0.0;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << seconds << "s";
    return oss.str();
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const std::chrono::duration<double> secs = end - start;
    return format_seconds(secs.count());
}

// Two decimals, no percent sign: the summary line is machine-read.
inline std::string format_percent(double pct) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << pct;
    return oss.str();
}

// 1234567 -> "1,234,567" for human-facing stderr lines.
inline std::string format_count(uint64_t n) {
    std::string digits = std::to_string(n);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    const size_t lead = digits.size() % 3;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i % 3) == lead) out += ',';
        out += digits[i];
    }
    return out;
}

}  // namespace log_utils
}  // namespace umicheck
