#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace transmute::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);
Bytes Sha256(const Bytes& data);
std::uint32_t Crc32(const Bytes& data);

std::string ToHex(const Bytes& data);
std::string Crc32Hex(std::uint32_t crc);

}  // namespace transmute::crypto
