#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Text codecs backed by libsodium
namespace codec
{

// Standard alphabet with padding. Whitespace and trailing garbage are rejected.
bool        base64_decode(std::string_view in, std::vector<std::uint8_t> &out);
std::string base64_encode(const std::vector<std::uint8_t> &in);

// Lowercase hex, used for log lines
std::string to_hex(const std::uint8_t *buf, std::size_t len);

}  // namespace codec
