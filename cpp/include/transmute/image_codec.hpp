#pragma once

#include <cstddef>
#include <memory>

#include "transmute/codec.hpp"

namespace transmute::codecs {

struct PixelGrid {
    int width = 0;
    int height = 0;
    Bytes rgb;
};

// Square-ish grid for a pixel count: width = ceil(sqrt(n)), height = ceil(n / width).
PixelGrid LayoutGrid(std::size_t pixel_count);

Bytes EncodePng(const PixelGrid& grid);
PixelGrid DecodePng(const Bytes& png);

std::unique_ptr<Codec> MakeImage();

}  // namespace transmute::codecs
