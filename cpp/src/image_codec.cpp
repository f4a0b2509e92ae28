#include "transmute/image_codec.hpp"

#include "transmute/constants.hpp"
#include "transmute/errors.hpp"
#include "transmute/format.hpp"

#define STB_IMAGE_IMPLEMENTATION
#define STBI_FAILURE_USERMSG
#include "stb_image.h"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace transmute::codecs {

namespace {

constexpr std::string_view kMaxSideOption = "max-side";

void AppendToBytes(void* context, void* data, int size) {
    auto* out = static_cast<Bytes*>(context);
    auto* begin = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), begin, begin + size);
}

std::size_t ParseMaxSide(const OptionMap& options) {
    auto it = options.find(std::string(kMaxSideOption));
    if (it == options.end()) {
        return constants::kDefaultMaxImageSide;
    }
    ErrorContext ctx;
    ctx.field = std::string(kMaxSideOption);
    std::size_t side = 0;
    try {
        std::size_t consumed = 0;
        unsigned long long parsed = std::stoull(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw Error("expected a positive integer, got '" + it->second + "'", ctx);
        }
        side = static_cast<std::size_t>(parsed);
    } catch (const std::logic_error&) {
        throw Error("expected a positive integer, got '" + it->second + "'", ctx);
    }
    if (side == 0 || side > static_cast<std::size_t>(std::numeric_limits<int>::max() / 3)) {
        throw Error("image side out of range", ctx);
    }
    return side;
}

std::size_t PixelsFor(std::size_t payload_size) {
    return std::max<std::size_t>(1, (payload_size + 2) / 3);
}

// Three payload bytes per RGB pixel. The representation is the raw byte stream;
// the grid is only built when the artifact is assembled.
class ImageCodec final : public Codec {
public:
    Mode mode() const override { return Mode::kImage; }

    Capabilities capabilities() const override {
        Capabilities caps;
        caps.bytes_per_group = 3;
        caps.units_per_group = 3;
        caps.carrier = Carrier::kImage;
        caps.max_payload = constants::kDefaultMaxImageSide * constants::kDefaultMaxImageSide * 3;
        caps.option_keys = {std::string(kMaxSideOption)};
        return caps;
    }

    void ValidateOptions(const OptionMap& options) const override {
        Codec::ValidateOptions(options);
        ParseMaxSide(options);
    }

    std::optional<std::size_t> Capacity(const OptionMap& options) const override {
        std::size_t side = ParseMaxSide(options);
        return side * side * 3;
    }

    Representation Represent(const Bytes& chunk) const override {
        return Representation{Mode::kImage, chunk};
    }

    Bytes Reconstruct(const Representation& rep) const override {
        if (rep.data.size() % 3 != 0) {
            throw Error("pixel stream ends inside a pixel");
        }
        return rep.data;
    }

    Bytes Assemble(const std::string& header_line,
                   const Bytes& body,
                   std::size_t payload_size,
                   const OptionMap&) const override {
        PixelGrid grid = LayoutGrid(PixelsFor(payload_size));
        std::copy_n(body.begin(), std::min(body.size(), grid.rgb.size()), grid.rgb.begin());
        Bytes png = EncodePng(grid);

        std::string line = header_line;
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
        }
        return format::InsertPngChunk(png, constants::kPngHeaderChunk, Bytes(line.begin(), line.end()));
    }

    Bytes Canonicalize(const Bytes& region, std::size_t payload_size) const override {
        PixelGrid grid = DecodePng(region);
        std::size_t used = PixelsFor(payload_size) * 3;
        if (payload_size == 0) {
            used = 0;
        }
        if (grid.rgb.size() > used) {
            grid.rgb.resize(used);
        }
        return std::move(grid.rgb);
    }
};

}  // namespace

PixelGrid LayoutGrid(std::size_t pixel_count) {
    pixel_count = std::max<std::size_t>(1, pixel_count);
    auto width = static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<double>(pixel_count))));
    while (width * width < pixel_count) {
        ++width;
    }
    while (width > 1 && (width - 1) * (width - 1) >= pixel_count) {
        --width;
    }
    std::size_t height = (pixel_count + width - 1) / width;

    PixelGrid grid;
    grid.width = static_cast<int>(width);
    grid.height = static_cast<int>(height);
    grid.rgb.assign(width * height * 3, constants::kPixelSentinel);
    return grid;
}

Bytes EncodePng(const PixelGrid& grid) {
    if (grid.width <= 0 || grid.height <= 0 ||
        grid.rgb.size() != static_cast<std::size_t>(grid.width) * static_cast<std::size_t>(grid.height) * 3) {
        throw Error("pixel grid does not match its dimensions");
    }
    Bytes out;
    if (!stbi_write_png_to_func(AppendToBytes, &out, grid.width, grid.height, 3,
                                grid.rgb.data(), grid.width * 3)) {
        throw Error("failed to encode PNG");
    }
    return out;
}

PixelGrid DecodePng(const Bytes& png) {
    if (png.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw Error("image is too large to decode");
    }
    int width = 0;
    int height = 0;
    int channels_in_file = 0;
    unsigned char* data = stbi_load_from_memory(png.data(), static_cast<int>(png.size()),
                                                &width, &height, &channels_in_file, 3);
    if (!data) {
        const char* reason = stbi_failure_reason();
        std::string msg = reason ? reason : "unknown error";
        throw Error("failed to decode image: " + msg);
    }
    std::size_t total = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 3;
    PixelGrid grid;
    grid.width = width;
    grid.height = height;
    grid.rgb.assign(data, data + total);
    stbi_image_free(data);
    return grid;
}

std::unique_ptr<Codec> MakeImage() {
    return std::make_unique<ImageCodec>();
}

}  // namespace transmute::codecs
