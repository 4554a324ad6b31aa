#include "umicheck/umi_extract.hpp"

#include <cctype>

namespace umicheck {

namespace {

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

UmiExtract extract_umi(std::string_view header, size_t expected_length) {
    UmiExtract result;

    size_t begin = 0;
    while (begin < header.size() && is_space(header[begin])) ++begin;
    if (begin == header.size()) {
        return result;
    }
    size_t end = begin;
    while (end < header.size() && !is_space(header[end])) ++end;

    std::string_view field = header.substr(begin, end - begin);
    const size_t sep = field.find_last_of(":_");
    std::string_view token = (sep == std::string_view::npos) ? field : field.substr(sep + 1);

    result.umi.assign(token.data(), token.size());
    if (token.size() != expected_length) {
        result.status = UmiStatus::LengthMismatch;
        return result;
    }

    for (char& c : result.umi) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    result.status = UmiStatus::Found;
    return result;
}

}  // namespace umicheck
