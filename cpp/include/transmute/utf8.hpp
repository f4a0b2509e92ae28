#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transmute::utf8 {

void Append(std::string& out, char32_t cp);
void Append(std::vector<std::uint8_t>& out, char32_t cp);

// Strict decode; nullopt on any malformed sequence.
std::optional<std::u32string> Decode(std::string_view text);

// Lenient decode; malformed bytes are skipped.
std::u32string DecodeLossy(std::string_view text);

bool IsAsciiSpace(char32_t cp);

}  // namespace transmute::utf8
