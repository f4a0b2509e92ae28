#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace transmute::format {

using Bytes = std::vector<std::uint8_t>;

std::uint32_t ReadU32BE(const Bytes& data, std::size_t offset);
void AppendU32BE(Bytes& out, std::uint32_t value);

bool IsPng(const Bytes& data);

// Returns the payload of the first chunk of the given type, or nullopt when absent.
// Throws MalformedHeaderError when the chunk stream is truncated or a CRC is wrong.
std::optional<Bytes> FindPngChunk(const Bytes& png, std::string_view type);

// Inserts a chunk right before the first IDAT.
Bytes InsertPngChunk(const Bytes& png, std::string_view type, const Bytes& payload);

}  // namespace transmute::format
