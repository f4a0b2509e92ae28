#include "transmute/format.hpp"

#include "transmute/errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <string>

namespace transmute::format {

namespace {

constexpr std::array<std::uint8_t, 8> kPngSignature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

std::uint32_t ChunkCrc(const std::uint8_t* type_and_data, std::size_t len) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, type_and_data, static_cast<uInt>(len));
    return static_cast<std::uint32_t>(crc);
}

// Offset of the first chunk whose type matches, or nullopt.
std::optional<std::size_t> LocateChunk(const Bytes& png, std::string_view type) {
    std::size_t offset = kPngSignature.size();
    while (offset < png.size()) {
        if (offset + 12 > png.size()) {
            throw MalformedHeaderError("truncated PNG chunk header", {"", "", std::nullopt, "png"});
        }
        std::uint32_t len = ReadU32BE(png, offset);
        if (static_cast<std::size_t>(len) > png.size() - offset - 12) {
            throw MalformedHeaderError("truncated PNG chunk", {"", "", std::nullopt, "png"});
        }
        std::string chunk_type(png.begin() + static_cast<std::ptrdiff_t>(offset + 4),
                               png.begin() + static_cast<std::ptrdiff_t>(offset + 8));
        if (chunk_type == type) {
            return offset;
        }
        if (chunk_type == "IEND") {
            break;
        }
        offset += 12 + static_cast<std::size_t>(len);
    }
    return std::nullopt;
}

}  // namespace

std::uint32_t ReadU32BE(const Bytes& data, std::size_t offset) {
    if (offset + 4 > data.size()) {
        throw Error("blob ends before a 4-byte length");
    }
    return (static_cast<std::uint32_t>(data[offset]) << 24)
           | (static_cast<std::uint32_t>(data[offset + 1]) << 16)
           | (static_cast<std::uint32_t>(data[offset + 2]) << 8)
           | static_cast<std::uint32_t>(data[offset + 3]);
}

void AppendU32BE(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

bool IsPng(const Bytes& data) {
    return data.size() >= kPngSignature.size()
           && std::equal(kPngSignature.begin(), kPngSignature.end(), data.begin());
}

std::optional<Bytes> FindPngChunk(const Bytes& png, std::string_view type) {
    if (!IsPng(png)) {
        throw MalformedHeaderError("not a PNG stream", {"", "", std::nullopt, "png"});
    }
    auto offset = LocateChunk(png, type);
    if (!offset) {
        return std::nullopt;
    }
    std::size_t pos = offset.value();
    std::uint32_t len = ReadU32BE(png, pos);
    std::uint32_t expected = ReadU32BE(png, pos + 8 + len);
    if (ChunkCrc(png.data() + pos + 4, 4 + static_cast<std::size_t>(len)) != expected) {
        throw MalformedHeaderError("PNG chunk " + std::string(type) + " fails its CRC",
                                   {"", "", std::nullopt, "png"});
    }
    return Bytes(png.begin() + static_cast<std::ptrdiff_t>(pos + 8),
                 png.begin() + static_cast<std::ptrdiff_t>(pos + 8 + len));
}

Bytes InsertPngChunk(const Bytes& png, std::string_view type, const Bytes& payload) {
    if (type.size() != 4) {
        throw Error("PNG chunk type must be four characters", {"", "", std::nullopt, "png"});
    }
    if (!IsPng(png)) {
        throw Error("not a PNG stream", {"", "", std::nullopt, "png"});
    }
    auto idat = LocateChunk(png, "IDAT");
    if (!idat) {
        throw Error("PNG stream has no IDAT chunk", {"", "", std::nullopt, "png"});
    }

    Bytes chunk;
    chunk.reserve(12 + payload.size());
    AppendU32BE(chunk, static_cast<std::uint32_t>(payload.size()));
    chunk.insert(chunk.end(), type.begin(), type.end());
    chunk.insert(chunk.end(), payload.begin(), payload.end());
    AppendU32BE(chunk, ChunkCrc(chunk.data() + 4, 4 + payload.size()));

    Bytes out;
    out.reserve(png.size() + chunk.size());
    out.insert(out.end(), png.begin(), png.begin() + static_cast<std::ptrdiff_t>(idat.value()));
    out.insert(out.end(), chunk.begin(), chunk.end());
    out.insert(out.end(), png.begin() + static_cast<std::ptrdiff_t>(idat.value()), png.end());
    return out;
}

}  // namespace transmute::format
