#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace transmute::io {

using Bytes = std::vector<std::uint8_t>;

// Both throw IoError.
Bytes ReadFile(const std::filesystem::path& path);

// Writes to path + "._tmp" and renames into place, so the target is either
// complete or untouched.
void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data);

}  // namespace transmute::io
