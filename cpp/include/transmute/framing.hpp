#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "transmute/codec.hpp"

namespace transmute {
class Registry;
}

namespace transmute::framing {

enum class Charset {
    kUtf8,
    kLatin1,
    kAscii,
};

std::string_view CharsetName(Charset charset);
std::optional<Charset> ParseCharset(std::string_view name);

struct Header {
    std::string version = "1";
    Mode mode = Mode::kBase64;
    Charset charset = Charset::kUtf8;
    bool keyed = false;
    std::string filename;  // UTF-8 in memory, transcoded on the wire
    std::uint64_t original_size = 0;
    // Checksums as written on the wire. A damaged value simply fails to match.
    std::string crc32;   // 8 lowercase hex digits
    std::string sha256;  // 64 lowercase hex digits
    std::uint64_t chunk_size = 0;
};

struct ParsedArtifact {
    Header header;
    Bytes remaining;
};

// Serialized header line, '\n' terminated.
std::string WriteHeader(const Header& header);

// Locates the header (first line, or the PNG header chunk) and returns it with
// the payload region. The mode must be registered in the given registry.
ParsedArtifact ReadHeader(const Bytes& artifact, const Registry& registry);

// Parses a single header line (with or without the trailing '\n').
Header ParseHeaderLine(std::string_view line, const Registry& registry);

// Throws MalformedHeaderError (field TMX-NAME) for invalid UTF-8 or a character
// the charset cannot carry.
void ValidateFilename(std::string_view utf8_name, Charset charset);
Bytes EncodeFilename(std::string_view utf8_name, Charset charset);
std::string DecodeFilename(const Bytes& raw, Charset charset);

}  // namespace transmute::framing
