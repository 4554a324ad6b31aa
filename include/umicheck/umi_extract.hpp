#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace umicheck {

enum class UmiStatus {
    Found,
    NotFound,
    LengthMismatch
};

struct UmiExtract {
    UmiStatus status = UmiStatus::NotFound;
    std::string umi;  // Uppercased when Found, raw token when LengthMismatch
};

/**
 * Extract the UMI token from a read header.
 *
 * Headers look like "READ_ID:UMI" or "READ_ID_UMI", optionally followed by
 * whitespace and a description. The token is the part of the first
 * whitespace-delimited field after its last ':' or '_' (the whole field when
 * neither separator occurs).
 */
UmiExtract extract_umi(std::string_view header, size_t expected_length);

}  // namespace umicheck
