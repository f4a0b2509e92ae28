#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Standard padded base64 for header fields, built on the base64 payload codec
// but strict about padding and returning the exact byte count.
namespace transmute::base64 {

std::string Encode(const std::vector<std::uint8_t>& data);

// Whitespace is skipped; nullopt on a foreign symbol, a partial quartet or
// misplaced padding.
std::optional<std::vector<std::uint8_t>> Decode(std::string_view input);

}  // namespace transmute::base64
