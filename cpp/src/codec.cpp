#include "transmute/codec.hpp"

#include "transmute/errors.hpp"
#include "transmute/utf8.hpp"

#include <array>
#include <utility>

namespace transmute {

namespace {

constexpr std::array<std::pair<Mode, std::string_view>, 11> kModeNames = {{
    {Mode::kBase64, "base64"},
    {Mode::kBase32, "base32"},
    {Mode::kBase85, "base85"},
    {Mode::kBase91, "base91"},
    {Mode::kHex, "hex"},
    {Mode::kBinary, "binary"},
    {Mode::kBraille, "braille"},
    {Mode::kEmoji, "emoji"},
    {Mode::kUuid, "uuid"},
    {Mode::kZeroWidth, "zero-width"},
    {Mode::kImage, "image"},
}};

}  // namespace

std::string_view ModeName(Mode mode) {
    for (const auto& entry : kModeNames) {
        if (entry.first == mode) {
            return entry.second;
        }
    }
    return "unknown";
}

std::optional<Mode> ParseMode(std::string_view name) {
    for (const auto& entry : kModeNames) {
        if (entry.second == name) {
            return entry.first;
        }
    }
    return std::nullopt;
}

const std::vector<Mode>& AllModes() {
    static const std::vector<Mode> modes = [] {
        std::vector<Mode> out;
        for (const auto& entry : kModeNames) {
            out.push_back(entry.first);
        }
        return out;
    }();
    return modes;
}

void Codec::ValidateOptions(const OptionMap& options) const {
    const auto keys = capabilities().option_keys;
    for (const auto& option : options) {
        bool known = false;
        for (const auto& key : keys) {
            if (key == option.first) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw Error("unknown option", {"", std::string(name()), std::nullopt, option.first});
        }
    }
}

std::optional<std::size_t> Codec::Capacity(const OptionMap&) const {
    return capabilities().max_payload;
}

Bytes Codec::Assemble(const std::string& header_line,
                      const Bytes& body,
                      std::size_t,
                      const OptionMap&) const {
    Bytes out;
    out.reserve(header_line.size() + body.size());
    out.insert(out.end(), header_line.begin(), header_line.end());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

Bytes Codec::Canonicalize(const Bytes& region, std::size_t) const {
    Bytes out;
    out.reserve(region.size());
    for (std::uint8_t byte : region) {
        if (utf8::IsAsciiSpace(byte)) {
            continue;
        }
        out.push_back(byte);
    }
    return out;
}

}  // namespace transmute
