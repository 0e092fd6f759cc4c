#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace panelsense {
namespace utils {

/**
 * Decode standard (RFC 4648) base64. Whitespace is ignored and padding is
 * optional. Returns std::nullopt on any character outside the alphabet
 * or on a truncated final quantum.
 */
std::optional<std::vector<uint8_t>> decodeBase64(std::string_view input);

std::string encodeBase64(const uint8_t* data, size_t size);

inline std::string encodeBase64(const std::vector<uint8_t>& data) {
    return encodeBase64(data.data(), data.size());
}

} // namespace utils
} // namespace panelsense
