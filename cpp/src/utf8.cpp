#include "transmute/utf8.hpp"

namespace transmute::utf8 {

namespace {

template <typename Out>
void AppendImpl(Out& out, char32_t cp) {
    using Unit = typename Out::value_type;
    if (cp < 0x80) {
        out.push_back(static_cast<Unit>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<Unit>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<Unit>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<Unit>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<Unit>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<Unit>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<Unit>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<Unit>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<Unit>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<Unit>(0x80 | (cp & 0x3F)));
    }
}

// Decodes one sequence at text[pos]; returns its length, or 0 when malformed.
std::size_t DecodeOne(std::string_view text, std::size_t pos, char32_t& cp) {
    auto byte = [&](std::size_t i) { return static_cast<unsigned char>(text[i]); };
    unsigned char lead = byte(pos);
    std::size_t len = 0;
    char32_t min = 0;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
        min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
        min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
        min = 0x10000;
    } else {
        return 0;
    }
    if (pos + len > text.size()) {
        return 0;
    }
    for (std::size_t i = 1; i < len; ++i) {
        unsigned char next = byte(pos + i);
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return len;
}

}  // namespace

void Append(std::string& out, char32_t cp) {
    AppendImpl(out, cp);
}

void Append(std::vector<std::uint8_t>& out, char32_t cp) {
    AppendImpl(out, cp);
}

std::optional<std::u32string> Decode(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        std::size_t len = DecodeOne(text, pos, cp);
        if (len == 0) {
            return std::nullopt;
        }
        out.push_back(cp);
        pos += len;
    }
    return out;
}

std::u32string DecodeLossy(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        std::size_t len = DecodeOne(text, pos, cp);
        if (len == 0) {
            ++pos;
            continue;
        }
        out.push_back(cp);
        pos += len;
    }
    return out;
}

bool IsAsciiSpace(char32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\v' || cp == '\f';
}

}  // namespace transmute::utf8
