#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "transmute/env.hpp"

namespace transmute::constants {

inline constexpr std::string_view kEngineVersion = "1.0.0";

// Header line: kHeaderMagic + base64(JSON fields) + '\n'
inline constexpr std::string_view kHeaderMagicPrefix = "TMX";
inline constexpr std::string_view kFormatVersion = "1";
inline constexpr std::string_view kHeaderMagic = "TMX1:";
inline constexpr std::size_t kMaxHeaderLine = 64u * 1024u;

// Private ancillary PNG chunk that carries the header line of image artifacts.
inline constexpr std::string_view kPngHeaderChunk = "tmXh";

inline constexpr std::size_t kDefaultChunkSize = 1u << 20;
inline constexpr std::size_t kDefaultMaxImageSide = 16384;
inline constexpr std::uint8_t kPixelSentinel = 0;

inline constexpr std::size_t kRandomNameMaxLength = 16;
inline constexpr std::string_view kTempSuffix = "._tmp";
inline constexpr std::string_view kDefaultDecodedName = "decoded.bin";

inline constexpr std::string_view kChunkSizeEnv = "TRANSMUTE_CHUNK_SIZE";
inline constexpr std::string_view kVerboseEnv = "TRANSMUTE_VERBOSE";

// TRANSMUTE_CHUNK_SIZE when it holds a positive integer, else kDefaultChunkSize.
inline std::size_t ChunkSize() {
    auto configured = transmute::env::GetPositive(kChunkSizeEnv);
    if (!configured) {
        return kDefaultChunkSize;
    }
    if (*configured > std::numeric_limits<std::size_t>::max()) {
        return std::numeric_limits<std::size_t>::max();
    }
    return static_cast<std::size_t>(*configured);
}

}  // namespace transmute::constants
