#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace transmute::cipher {

using Bytes = std::vector<std::uint8_t>;

// XOR with a cyclic key. offset is the payload position of data[0], so a payload
// processed piecewise yields the same bytes as one processed whole.
void ApplyInPlace(Bytes& data, const Bytes& key, std::size_t offset = 0);

Bytes Apply(const Bytes& data, const Bytes& key);
Bytes Reverse(const Bytes& data, const Bytes& key);

}  // namespace transmute::cipher
