#include "transmute/text_codecs.hpp"

#include "transmute/errors.hpp"
#include "transmute/utf8.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <string>
#include <string_view>

namespace transmute::codecs {

namespace {

std::string SymbolText(std::uint8_t byte) {
    if (byte >= 0x20 && byte < 0x7F) {
        return std::string("'") + static_cast<char>(byte) + "'";
    }
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "0x%02x", byte);
    return buffer;
}

std::array<std::int16_t, 256> BuildDecodeTable(std::string_view alphabet, bool fold_case) {
    std::array<std::int16_t, 256> table{};
    table.fill(-1);
    for (std::size_t i = 0; i < alphabet.size(); ++i) {
        unsigned char ch = static_cast<unsigned char>(alphabet[i]);
        table[ch] = static_cast<std::int16_t>(i);
        if (fold_case) {
            table[static_cast<unsigned char>(std::tolower(ch))] = static_cast<std::int16_t>(i);
            table[static_cast<unsigned char>(std::toupper(ch))] = static_cast<std::int16_t>(i);
        }
    }
    return table;
}

void RequireWholeGroups(const Representation& rep, std::size_t units_per_group) {
    if (rep.data.size() % units_per_group != 0) {
        throw Error("representation ends inside a symbol group");
    }
}

// Power-of-two alphabets: a group of bytes is read as one big-endian bit string and
// cut into fixed-width symbols. A short final group is zero-filled and the symbols
// past its data are replaced by the padding character.
class BitPackCodec final : public Codec {
public:
    BitPackCodec(Mode mode,
                 std::string_view alphabet,
                 unsigned bits_per_symbol,
                 std::size_t bytes_per_group,
                 char pad,
                 bool fold_case)
        : mode_(mode),
          alphabet_(alphabet),
          bits_(bits_per_symbol),
          group_bytes_(bytes_per_group),
          symbols_(bytes_per_group * 8 / bits_per_symbol),
          pad_(pad),
          table_(BuildDecodeTable(alphabet, fold_case)) {}

    Mode mode() const override { return mode_; }

    Capabilities capabilities() const override {
        Capabilities caps;
        caps.bytes_per_group = group_bytes_;
        caps.units_per_group = symbols_;
        return caps;
    }

    Representation Represent(const Bytes& chunk) const override {
        Representation rep{mode_, {}};
        rep.data.reserve(((chunk.size() + group_bytes_ - 1) / group_bytes_) * symbols_);
        const std::uint64_t mask = (1u << bits_) - 1u;
        const std::size_t total_bits = group_bytes_ * 8;
        for (std::size_t offset = 0; offset < chunk.size(); offset += group_bytes_) {
            std::size_t n = std::min(group_bytes_, chunk.size() - offset);
            std::uint64_t acc = 0;
            for (std::size_t i = 0; i < group_bytes_; ++i) {
                acc = (acc << 8) | (i < n ? chunk[offset + i] : 0u);
            }
            std::size_t used = (n * 8 + bits_ - 1) / bits_;
            for (std::size_t s = 0; s < symbols_; ++s) {
                if (s < used) {
                    std::size_t shift = total_bits - (s + 1) * bits_;
                    rep.data.push_back(static_cast<std::uint8_t>(alphabet_[(acc >> shift) & mask]));
                } else {
                    rep.data.push_back(static_cast<std::uint8_t>(pad_));
                }
            }
        }
        return rep;
    }

    Bytes Reconstruct(const Representation& rep) const override {
        RequireWholeGroups(rep, symbols_);
        Bytes out;
        out.reserve(rep.data.size() / symbols_ * group_bytes_);
        for (std::size_t offset = 0; offset < rep.data.size(); offset += symbols_) {
            std::uint64_t acc = 0;
            bool padding = false;
            for (std::size_t s = 0; s < symbols_; ++s) {
                std::uint8_t symbol = rep.data[offset + s];
                std::int16_t value = table_[symbol];
                if (pad_ != '\0' && symbol == static_cast<std::uint8_t>(pad_) && s > 0) {
                    padding = true;
                    value = 0;
                } else if (value < 0 || padding) {
                    throw Error("invalid symbol " + SymbolText(symbol));
                }
                acc = (acc << bits_) | static_cast<std::uint64_t>(value);
            }
            for (std::size_t i = 0; i < group_bytes_; ++i) {
                std::size_t shift = (group_bytes_ - 1 - i) * 8;
                out.push_back(static_cast<std::uint8_t>((acc >> shift) & 0xFF));
            }
        }
        return out;
    }

private:
    Mode mode_;
    std::string_view alphabet_;
    unsigned bits_;
    std::size_t group_bytes_;
    std::size_t symbols_;
    char pad_;
    std::array<std::int16_t, 256> table_;
};

constexpr std::string_view kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::string_view kBase32Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr std::string_view kHexAlphabet = "0123456789abcdef";
constexpr std::string_view kBinaryAlphabet = "01";

// RFC 1924 character set; 4 bytes -> 5 digits, most significant first.
constexpr std::string_view kBase85Alphabet =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz!#$%&()*+-;<=>?@^_`{|}~";

class Base85Codec final : public Codec {
public:
    Base85Codec() : table_(BuildDecodeTable(kBase85Alphabet, false)) {}

    Mode mode() const override { return Mode::kBase85; }

    Capabilities capabilities() const override {
        Capabilities caps;
        caps.bytes_per_group = 4;
        caps.units_per_group = 5;
        return caps;
    }

    Representation Represent(const Bytes& chunk) const override {
        Representation rep{Mode::kBase85, {}};
        rep.data.reserve((chunk.size() + 3) / 4 * 5);
        for (std::size_t offset = 0; offset < chunk.size(); offset += 4) {
            std::uint32_t value = 0;
            for (std::size_t i = 0; i < 4; ++i) {
                std::size_t idx = offset + i;
                value = (value << 8) | (idx < chunk.size() ? chunk[idx] : 0u);
            }
            std::array<std::uint8_t, 5> digits{};
            for (int d = 4; d >= 0; --d) {
                digits[static_cast<std::size_t>(d)] = static_cast<std::uint8_t>(kBase85Alphabet[value % 85]);
                value /= 85;
            }
            rep.data.insert(rep.data.end(), digits.begin(), digits.end());
        }
        return rep;
    }

    Bytes Reconstruct(const Representation& rep) const override {
        RequireWholeGroups(rep, 5);
        Bytes out;
        out.reserve(rep.data.size() / 5 * 4);
        for (std::size_t offset = 0; offset < rep.data.size(); offset += 5) {
            std::uint64_t value = 0;
            for (std::size_t d = 0; d < 5; ++d) {
                std::int16_t digit = table_[rep.data[offset + d]];
                if (digit < 0) {
                    throw Error("invalid symbol " + SymbolText(rep.data[offset + d]));
                }
                value = value * 85 + static_cast<std::uint64_t>(digit);
            }
            if (value > 0xFFFFFFFFull) {
                throw Error("base85 group overflows 32 bits");
            }
            AppendBe32(out, static_cast<std::uint32_t>(value));
        }
        return out;
    }

private:
    static void AppendBe32(Bytes& out, std::uint32_t value) {
        out.push_back(static_cast<std::uint8_t>(value >> 24));
        out.push_back(static_cast<std::uint8_t>(value >> 16));
        out.push_back(static_cast<std::uint8_t>(value >> 8));
        out.push_back(static_cast<std::uint8_t>(value));
    }

    std::array<std::int16_t, 256> table_;
};

constexpr std::string_view kBase91Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789!#$%&()*+,./:;<=>?@[]^_`{|}~\"";

// 13-bit values, least significant bits first, each written as two base-91 digits.
// 13 bytes = 104 bits = 8 values = 16 symbols, so groups never share bits.
class Base91Codec final : public Codec {
public:
    static constexpr std::size_t kGroupBytes = 13;
    static constexpr std::size_t kGroupSymbols = 16;

    Base91Codec() : table_(BuildDecodeTable(kBase91Alphabet, false)) {}

    Mode mode() const override { return Mode::kBase91; }

    Capabilities capabilities() const override {
        Capabilities caps;
        caps.bytes_per_group = kGroupBytes;
        caps.units_per_group = kGroupSymbols;
        return caps;
    }

    Representation Represent(const Bytes& chunk) const override {
        Representation rep{Mode::kBase91, {}};
        rep.data.reserve((chunk.size() + kGroupBytes - 1) / kGroupBytes * kGroupSymbols);
        for (std::size_t offset = 0; offset < chunk.size(); offset += kGroupBytes) {
            std::uint32_t queue = 0;
            unsigned bits = 0;
            for (std::size_t i = 0; i < kGroupBytes; ++i) {
                std::size_t idx = offset + i;
                queue |= static_cast<std::uint32_t>(idx < chunk.size() ? chunk[idx] : 0u) << bits;
                bits += 8;
                if (bits >= 13) {
                    std::uint32_t value = queue & 8191u;
                    rep.data.push_back(static_cast<std::uint8_t>(kBase91Alphabet[value / 91]));
                    rep.data.push_back(static_cast<std::uint8_t>(kBase91Alphabet[value % 91]));
                    queue >>= 13;
                    bits -= 13;
                }
            }
        }
        return rep;
    }

    Bytes Reconstruct(const Representation& rep) const override {
        RequireWholeGroups(rep, kGroupSymbols);
        Bytes out;
        out.reserve(rep.data.size() / kGroupSymbols * kGroupBytes);
        for (std::size_t offset = 0; offset < rep.data.size(); offset += kGroupSymbols) {
            std::uint32_t queue = 0;
            unsigned bits = 0;
            for (std::size_t s = 0; s < kGroupSymbols; s += 2) {
                std::int16_t high = table_[rep.data[offset + s]];
                std::int16_t low = table_[rep.data[offset + s + 1]];
                if (high < 0 || low < 0) {
                    throw Error("invalid symbol " + SymbolText(rep.data[offset + (high < 0 ? s : s + 1)]));
                }
                std::uint32_t value = static_cast<std::uint32_t>(high) * 91u + static_cast<std::uint32_t>(low);
                if (value > 8191u) {
                    throw Error("base91 pair exceeds 13 bits");
                }
                queue |= value << bits;
                bits += 13;
                while (bits >= 8) {
                    out.push_back(static_cast<std::uint8_t>(queue & 0xFF));
                    queue >>= 8;
                    bits -= 8;
                }
            }
        }
        return out;
    }

private:
    std::array<std::int16_t, 256> table_;
};

// One code point per byte: base + value.
class GlyphCodec final : public Codec {
public:
    GlyphCodec(Mode mode, char32_t base, std::size_t utf8_width)
        : mode_(mode), base_(base), width_(utf8_width) {}

    Mode mode() const override { return mode_; }

    Capabilities capabilities() const override {
        Capabilities caps;
        caps.bytes_per_group = 1;
        caps.units_per_group = width_;
        return caps;
    }

    Representation Represent(const Bytes& chunk) const override {
        Representation rep{mode_, {}};
        rep.data.reserve(chunk.size() * width_);
        for (std::uint8_t byte : chunk) {
            utf8::Append(rep.data, base_ + byte);
        }
        return rep;
    }

    Bytes Reconstruct(const Representation& rep) const override {
        std::string_view text(reinterpret_cast<const char*>(rep.data.data()), rep.data.size());
        auto decoded = utf8::Decode(text);
        if (!decoded) {
            throw Error("malformed UTF-8 in glyph stream");
        }
        Bytes out;
        out.reserve(decoded->size());
        for (char32_t cp : *decoded) {
            if (cp < base_ || cp > base_ + 0xFF) {
                char buffer[16];
                std::snprintf(buffer, sizeof(buffer), "U+%04X", static_cast<unsigned>(cp));
                throw Error(std::string("invalid glyph ") + buffer);
            }
            out.push_back(static_cast<std::uint8_t>(cp - base_));
        }
        return out;
    }

private:
    Mode mode_;
    char32_t base_;
    std::size_t width_;
};

// Sixteen bytes as a lowercase 8-4-4-4-12 line. The version and variant nibbles
// carry data, so the lines are UUID-shaped rather than conforming UUIDs.
class UuidCodec final : public Codec {
public:
    static constexpr std::size_t kGroupBytes = 16;
    static constexpr std::size_t kGroupDigits = 32;

    UuidCodec() : table_(BuildDecodeTable(kHexAlphabet, true)) {}

    Mode mode() const override { return Mode::kUuid; }

    Capabilities capabilities() const override {
        Capabilities caps;
        caps.bytes_per_group = kGroupBytes;
        caps.units_per_group = kGroupDigits;
        return caps;
    }

    Representation Represent(const Bytes& chunk) const override {
        Representation rep{Mode::kUuid, {}};
        rep.data.reserve((chunk.size() + kGroupBytes - 1) / kGroupBytes * 37);
        for (std::size_t offset = 0; offset < chunk.size(); offset += kGroupBytes) {
            for (std::size_t i = 0; i < kGroupBytes; ++i) {
                if (i == 4 || i == 6 || i == 8 || i == 10) {
                    rep.data.push_back('-');
                }
                std::size_t idx = offset + i;
                std::uint8_t byte = idx < chunk.size() ? chunk[idx] : 0u;
                rep.data.push_back(static_cast<std::uint8_t>(kHexAlphabet[byte >> 4]));
                rep.data.push_back(static_cast<std::uint8_t>(kHexAlphabet[byte & 0x0F]));
            }
            rep.data.push_back('\n');
        }
        return rep;
    }

    Bytes Reconstruct(const Representation& rep) const override {
        RequireWholeGroups(rep, kGroupDigits);
        Bytes out;
        out.reserve(rep.data.size() / 2);
        for (std::size_t i = 0; i < rep.data.size(); i += 2) {
            std::int16_t high = table_[rep.data[i]];
            std::int16_t low = table_[rep.data[i + 1]];
            if (high < 0 || low < 0) {
                throw Error("invalid symbol " + SymbolText(rep.data[high < 0 ? i : i + 1]));
            }
            out.push_back(static_cast<std::uint8_t>((high << 4) | low));
        }
        return out;
    }

    Bytes Canonicalize(const Bytes& region, std::size_t payload_size) const override {
        Bytes out = Codec::Canonicalize(region, payload_size);
        out.erase(std::remove(out.begin(), out.end(), static_cast<std::uint8_t>('-')), out.end());
        return out;
    }

private:
    std::array<std::int16_t, 256> table_;
};

}  // namespace

std::unique_ptr<Codec> MakeBase64() {
    return std::make_unique<BitPackCodec>(Mode::kBase64, kBase64Alphabet, 6, 3, '=', false);
}

std::unique_ptr<Codec> MakeBase32() {
    return std::make_unique<BitPackCodec>(Mode::kBase32, kBase32Alphabet, 5, 5, '=', true);
}

std::unique_ptr<Codec> MakeHex() {
    return std::make_unique<BitPackCodec>(Mode::kHex, kHexAlphabet, 4, 1, '\0', true);
}

std::unique_ptr<Codec> MakeBinary() {
    return std::make_unique<BitPackCodec>(Mode::kBinary, kBinaryAlphabet, 1, 1, '\0', false);
}

std::unique_ptr<Codec> MakeBase85() {
    return std::make_unique<Base85Codec>();
}

std::unique_ptr<Codec> MakeBase91() {
    return std::make_unique<Base91Codec>();
}

std::unique_ptr<Codec> MakeBraille() {
    return std::make_unique<GlyphCodec>(Mode::kBraille, U'\u2800', 3);
}

std::unique_ptr<Codec> MakeEmoji() {
    return std::make_unique<GlyphCodec>(Mode::kEmoji, U'\U0001F300', 4);
}

std::unique_ptr<Codec> MakeUuid() {
    return std::make_unique<UuidCodec>();
}

}  // namespace transmute::codecs
