#include "transmute/framing.hpp"

#include "transmute/base64.hpp"
#include "transmute/constants.hpp"
#include "transmute/errors.hpp"
#include "transmute/format.hpp"
#include "transmute/registry.hpp"
#include "transmute/utf8.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>
#include <utility>

namespace transmute::framing {

namespace {

constexpr std::string_view kKeyVersion = "TMX-VERSION";
constexpr std::string_view kKeyMode = "TMX-MODE";
constexpr std::string_view kKeyCharset = "TMX-CHARSET";
constexpr std::string_view kKeyKeyed = "TMX-KEYED";
constexpr std::string_view kKeyName = "TMX-NAME";
constexpr std::string_view kKeySize = "TMX-SIZE";
constexpr std::string_view kKeyCrc32 = "TMX-CRC32";
constexpr std::string_view kKeySha256 = "TMX-SHA256";
constexpr std::string_view kKeyChunk = "TMX-CHUNK";

using FieldMap = std::map<std::string, std::string, std::less<>>;

[[noreturn]] void Malformed(const std::string& detail, std::string_view field = {}) {
    ErrorContext ctx;
    ctx.field = std::string(field);
    throw MalformedHeaderError(detail, std::move(ctx));
}

std::string EscapeJson(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        if (ch == '\\' || ch == '"') {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    return out;
}

std::string BuildJson(const std::vector<std::pair<std::string_view, std::string>>& fields) {
    std::string json;
    json.reserve(fields.size() * 32);
    json.push_back('{');
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            json.push_back(',');
        }
        json.push_back('"');
        json += EscapeJson(fields[i].first);
        json += "\":\"";
        json += EscapeJson(fields[i].second);
        json.push_back('"');
    }
    json.push_back('}');
    return json;
}

// Reads a quoted string starting at json[pos] == '"'. Returns the index after the
// closing quote, or npos when the string is unterminated.
std::size_t ReadQuoted(const std::string& json, std::size_t pos, std::string& out) {
    out.clear();
    for (std::size_t i = pos + 1; i < json.size(); ++i) {
        char ch = json[i];
        if (ch == '\\') {
            if (i + 1 >= json.size()) {
                return std::string::npos;
            }
            out.push_back(json[++i]);
        } else if (ch == '"') {
            return i + 1;
        } else {
            out.push_back(ch);
        }
    }
    return std::string::npos;
}

FieldMap ParseJson(const std::string& json) {
    FieldMap result;
    std::size_t pos = json.find('{');
    if (pos == std::string::npos) {
        Malformed("header body is not a JSON object");
    }
    std::string key;
    std::string value;
    while (true) {
        pos = json.find_first_of("\"}", pos + 1);
        if (pos == std::string::npos) {
            Malformed("header body is truncated");
        }
        if (json[pos] == '}') {
            break;
        }
        std::size_t key_end = ReadQuoted(json, pos, key);
        if (key_end == std::string::npos) {
            Malformed("header body is truncated");
        }
        std::size_t colon = json.find(':', key_end);
        if (colon == std::string::npos) {
            Malformed("missing value", key);
        }
        std::size_t val_start = json.find('"', colon + 1);
        if (val_start == std::string::npos) {
            Malformed("missing value", key);
        }
        std::size_t val_end = ReadQuoted(json, val_start, value);
        if (val_end == std::string::npos) {
            Malformed("value is truncated", key);
        }
        result[key] = value;
        pos = val_end - 1;
    }
    return result;
}

const std::string& Require(const FieldMap& fields, std::string_view key) {
    auto it = fields.find(key);
    if (it == fields.end()) {
        Malformed("required field missing", key);
    }
    return it->second;
}

std::uint64_t ParseDecimal(const std::string& text, std::string_view field) {
    if (text.empty() || text.size() > 20 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        Malformed("expected a decimal integer, got '" + text + "'", field);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        Malformed("integer out of range", field);
    }
}

}  // namespace

std::string_view CharsetName(Charset charset) {
    switch (charset) {
        case Charset::kUtf8:
            return "utf-8";
        case Charset::kLatin1:
            return "latin-1";
        case Charset::kAscii:
            return "ascii";
    }
    return "utf-8";
}

std::optional<Charset> ParseCharset(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "utf-8" || lowered == "utf8") {
        return Charset::kUtf8;
    }
    if (lowered == "latin-1" || lowered == "latin1" || lowered == "iso-8859-1") {
        return Charset::kLatin1;
    }
    if (lowered == "ascii" || lowered == "us-ascii") {
        return Charset::kAscii;
    }
    return std::nullopt;
}

void ValidateFilename(std::string_view utf8_name, Charset charset) {
    auto code_points = utf8::Decode(utf8_name);
    if (!code_points) {
        Malformed("filename is not valid UTF-8", kKeyName);
    }
    if (charset == Charset::kUtf8) {
        return;
    }
    const char32_t limit = charset == Charset::kLatin1 ? 0xFF : 0x7F;
    for (char32_t cp : *code_points) {
        if (cp > limit) {
            Malformed("filename cannot be represented in " + std::string(CharsetName(charset)), kKeyName);
        }
    }
}

Bytes EncodeFilename(std::string_view utf8_name, Charset charset) {
    ValidateFilename(utf8_name, charset);
    if (charset == Charset::kUtf8) {
        return Bytes(utf8_name.begin(), utf8_name.end());
    }
    Bytes out;
    for (char32_t cp : utf8::DecodeLossy(utf8_name)) {
        out.push_back(static_cast<std::uint8_t>(cp));
    }
    return out;
}

std::string DecodeFilename(const Bytes& raw, Charset charset) {
    std::string out;
    switch (charset) {
        case Charset::kUtf8: {
            std::string text(raw.begin(), raw.end());
            if (!utf8::Decode(text)) {
                Malformed("filename is not valid UTF-8", kKeyName);
            }
            return text;
        }
        case Charset::kAscii:
            for (std::uint8_t byte : raw) {
                if (byte > 0x7F) {
                    Malformed("filename is not ASCII", kKeyName);
                }
                out.push_back(static_cast<char>(byte));
            }
            return out;
        case Charset::kLatin1:
            for (std::uint8_t byte : raw) {
                utf8::Append(out, static_cast<char32_t>(byte));
            }
            return out;
    }
    return out;
}

std::string WriteHeader(const Header& header) {
    std::vector<std::pair<std::string_view, std::string>> fields;
    fields.emplace_back(kKeyVersion, header.version);
    fields.emplace_back(kKeyMode, std::string(ModeName(header.mode)));
    fields.emplace_back(kKeyCharset, std::string(CharsetName(header.charset)));
    fields.emplace_back(kKeyKeyed, header.keyed ? "yes" : "no");
    fields.emplace_back(kKeyName, base64::Encode(EncodeFilename(header.filename, header.charset)));
    fields.emplace_back(kKeySize, std::to_string(header.original_size));
    fields.emplace_back(kKeyCrc32, header.crc32);
    fields.emplace_back(kKeySha256, header.sha256);
    fields.emplace_back(kKeyChunk, std::to_string(header.chunk_size));

    std::string json = BuildJson(fields);
    std::string line(constants::kHeaderMagic);
    line += base64::Encode(Bytes(json.begin(), json.end()));
    line.push_back('\n');
    return line;
}

Header ParseHeaderLine(std::string_view line, const Registry& registry) {
    if (!line.empty() && line.back() == '\n') {
        line.remove_suffix(1);
    }
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    std::string_view prefix = constants::kHeaderMagicPrefix;
    if (line.size() < prefix.size() || line.substr(0, prefix.size()) != prefix) {
        Malformed("missing header magic");
    }
    std::size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
        Malformed("missing header magic");
    }
    std::string_view tag_version = line.substr(prefix.size(), colon - prefix.size());
    if (tag_version != constants::kFormatVersion) {
        Malformed("unrecognized format version '" + std::string(tag_version) + "'", kKeyVersion);
    }

    auto decoded = base64::Decode(line.substr(colon + 1));
    if (!decoded) {
        Malformed("header body is not valid base64");
    }
    FieldMap fields = ParseJson(std::string(decoded->begin(), decoded->end()));

    Header header;
    header.version = Require(fields, kKeyVersion);
    if (header.version != constants::kFormatVersion) {
        Malformed("unrecognized format version '" + header.version + "'", kKeyVersion);
    }

    const std::string& mode_name = Require(fields, kKeyMode);
    auto mode = ParseMode(mode_name);
    if (!mode || !registry.Contains(*mode)) {
        ErrorContext ctx;
        ctx.field = std::string(kKeyMode);
        throw UnsupportedModeError("no codec registered for mode '" + mode_name + "'", std::move(ctx));
    }
    header.mode = *mode;

    const std::string& charset_name = Require(fields, kKeyCharset);
    auto charset = ParseCharset(charset_name);
    if (!charset) {
        Malformed("unknown charset '" + charset_name + "'", kKeyCharset);
    }
    header.charset = *charset;

    const std::string& keyed = Require(fields, kKeyKeyed);
    if (keyed != "yes" && keyed != "no") {
        Malformed("expected yes or no, got '" + keyed + "'", kKeyKeyed);
    }
    header.keyed = keyed == "yes";

    auto raw_name = base64::Decode(Require(fields, kKeyName));
    if (!raw_name) {
        Malformed("filename is not valid base64", kKeyName);
    }
    header.filename = DecodeFilename(*raw_name, header.charset);

    header.original_size = ParseDecimal(Require(fields, kKeySize), kKeySize);

    header.crc32 = Require(fields, kKeyCrc32);
    header.sha256 = Require(fields, kKeySha256);

    header.chunk_size = ParseDecimal(Require(fields, kKeyChunk), kKeyChunk);
    return header;
}

ParsedArtifact ReadHeader(const Bytes& artifact, const Registry& registry) {
    ParsedArtifact parsed;
    if (format::IsPng(artifact)) {
        auto chunk = format::FindPngChunk(artifact, constants::kPngHeaderChunk);
        if (!chunk) {
            Malformed("image carries no header chunk");
        }
        std::string line(chunk->begin(), chunk->end());
        parsed.header = ParseHeaderLine(line, registry);
        parsed.remaining = artifact;
        return parsed;
    }

    std::size_t limit = std::min(artifact.size(), constants::kMaxHeaderLine);
    auto end = std::find(artifact.begin(), artifact.begin() + static_cast<std::ptrdiff_t>(limit), '\n');
    if (end == artifact.begin() + static_cast<std::ptrdiff_t>(limit)) {
        Malformed(artifact.empty() ? "artifact is empty" : "header line is unterminated");
    }
    std::string line(artifact.begin(), end);
    parsed.header = ParseHeaderLine(line, registry);
    parsed.remaining.assign(end + 1, artifact.end());
    return parsed;
}

}  // namespace transmute::framing
