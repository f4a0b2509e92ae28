#pragma once

#include <memory>

#include "transmute/codec.hpp"

namespace transmute::codecs {

// Dense alphabets: each fixed group of bytes maps to a fixed group of symbols.
std::unique_ptr<Codec> MakeBase64();
std::unique_ptr<Codec> MakeBase32();
std::unique_ptr<Codec> MakeBase85();
std::unique_ptr<Codec> MakeBase91();
std::unique_ptr<Codec> MakeHex();
std::unique_ptr<Codec> MakeBinary();

// One Unicode glyph per byte.
std::unique_ptr<Codec> MakeBraille();
std::unique_ptr<Codec> MakeEmoji();

// Sixteen bytes per 8-4-4-4-12 line.
std::unique_ptr<Codec> MakeUuid();

}  // namespace transmute::codecs
