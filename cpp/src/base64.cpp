#include "transmute/base64.hpp"

#include "transmute/errors.hpp"
#include "transmute/text_codecs.hpp"
#include "transmute/utf8.hpp"

#include <algorithm>
#include <memory>
#include <utility>

namespace transmute::base64 {

namespace {

constexpr std::uint8_t kPad = '=';

// The payload mode's codec; header fields use the same alphabet and padding.
const Codec& SharedCodec() {
    static const std::unique_ptr<Codec> codec = codecs::MakeBase64();
    return *codec;
}

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    Bytes symbols = SharedCodec().Represent(data).data;
    return std::string(symbols.begin(), symbols.end());
}

std::optional<std::vector<std::uint8_t>> Decode(std::string_view input) {
    Bytes symbols;
    symbols.reserve(input.size());
    for (char ch : input) {
        if (!utf8::IsAsciiSpace(static_cast<unsigned char>(ch))) {
            symbols.push_back(static_cast<std::uint8_t>(ch));
        }
    }
    if (symbols.size() % 4 != 0) {
        return std::nullopt;
    }
    // Padding may only close the final quartet, one or two symbols long.
    auto first_pad = std::find(symbols.begin(), symbols.end(), kPad);
    const auto pad_count = static_cast<std::size_t>(symbols.end() - first_pad);
    if (pad_count > 2 || !std::all_of(first_pad, symbols.end(), [](std::uint8_t s) { return s == kPad; })) {
        return std::nullopt;
    }

    Bytes out;
    try {
        out = SharedCodec().Reconstruct(Representation{Mode::kBase64, std::move(symbols)});
    } catch (const Error&) {
        return std::nullopt;
    }
    out.resize(out.size() - pad_count);
    return out;
}

}  // namespace transmute::base64
