#pragma once

#include <array>
#include <memory>

#include "transmute/codec.hpp"

namespace transmute::codecs {

// Zero-width code points for the 2-bit values 0..3.
inline constexpr std::array<char32_t, 4> kZeroWidthAlphabet = {0x200B, 0x200C, 0x200D, 0x2060};

std::unique_ptr<Codec> MakeZeroWidth();

}  // namespace transmute::codecs
