#include "transmute/zero_width.hpp"

#include "transmute/errors.hpp"
#include "transmute/utf8.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace transmute::codecs {

namespace {

constexpr std::string_view kCarrierOption = "carrier";
// Each code point is three UTF-8 bytes; four of them carry one byte.
constexpr std::size_t kUnitsPerByte = 12;

int ZeroWidthValue(char32_t cp) {
    auto it = std::find(kZeroWidthAlphabet.begin(), kZeroWidthAlphabet.end(), cp);
    return it == kZeroWidthAlphabet.end() ? -1 : static_cast<int>(it - kZeroWidthAlphabet.begin());
}

class ZeroWidthCodec final : public Codec {
public:
    Mode mode() const override { return Mode::kZeroWidth; }

    Capabilities capabilities() const override {
        Capabilities caps;
        caps.bytes_per_group = 1;
        caps.units_per_group = kUnitsPerByte;
        caps.option_keys = {std::string(kCarrierOption)};
        return caps;
    }

    Representation Represent(const Bytes& chunk) const override {
        Representation rep{Mode::kZeroWidth, {}};
        rep.data.reserve(chunk.size() * kUnitsPerByte);
        for (std::uint8_t byte : chunk) {
            for (int shift = 6; shift >= 0; shift -= 2) {
                utf8::Append(rep.data, kZeroWidthAlphabet[(byte >> shift) & 0x03]);
            }
        }
        return rep;
    }

    Bytes Reconstruct(const Representation& rep) const override {
        std::string_view text(reinterpret_cast<const char*>(rep.data.data()), rep.data.size());
        auto decoded = utf8::Decode(text);
        if (!decoded || decoded->size() % 4 != 0) {
            throw Error("zero-width stream is not a whole number of bytes");
        }
        Bytes out;
        out.reserve(decoded->size() / 4);
        for (std::size_t i = 0; i < decoded->size(); i += 4) {
            int byte = 0;
            for (std::size_t j = 0; j < 4; ++j) {
                int value = ZeroWidthValue((*decoded)[i + j]);
                if (value < 0) {
                    throw Error("unexpected code point in zero-width stream");
                }
                byte = (byte << 2) | value;
            }
            out.push_back(static_cast<std::uint8_t>(byte));
        }
        return out;
    }

    // The hidden run goes right after the first character of the carrier text.
    Bytes Assemble(const std::string& header_line,
                   const Bytes& body,
                   std::size_t payload_size,
                   const OptionMap& options) const override {
        auto it = options.find(std::string(kCarrierOption));
        if (it == options.end() || it->second.empty()) {
            return Codec::Assemble(header_line, body, payload_size, options);
        }
        auto carrier = utf8::Decode(it->second);
        if (!carrier) {
            ErrorContext ctx;
            ctx.field = std::string(kCarrierOption);
            throw Error("carrier text is not valid UTF-8", std::move(ctx));
        }
        std::string prefix;
        std::string rest;
        bool placed_first = false;
        for (char32_t cp : *carrier) {
            if (ZeroWidthValue(cp) >= 0) {
                continue;
            }
            utf8::Append(placed_first ? rest : prefix, cp);
            placed_first = true;
        }
        Bytes out(header_line.begin(), header_line.end());
        out.insert(out.end(), prefix.begin(), prefix.end());
        out.insert(out.end(), body.begin(), body.end());
        out.insert(out.end(), rest.begin(), rest.end());
        return out;
    }

    Bytes Canonicalize(const Bytes& region, std::size_t) const override {
        std::string_view text(reinterpret_cast<const char*>(region.data()), region.size());
        Bytes out;
        for (char32_t cp : utf8::DecodeLossy(text)) {
            if (ZeroWidthValue(cp) >= 0) {
                utf8::Append(out, cp);
            }
        }
        return out;
    }
};

}  // namespace

std::unique_ptr<Codec> MakeZeroWidth() {
    return std::make_unique<ZeroWidthCodec>();
}

}  // namespace transmute::codecs
