#include "transmute/registry.hpp"

#include "transmute/errors.hpp"
#include "transmute/image_codec.hpp"
#include "transmute/text_codecs.hpp"
#include "transmute/zero_width.hpp"

#include <utility>

namespace transmute {

Registry::Registry(std::vector<std::unique_ptr<Codec>> codecs) {
    for (auto& codec : codecs) {
        if (!codec) {
            continue;
        }
        Mode mode = codec->mode();
        if (codecs_.count(mode) != 0) {
            throw Error("duplicate codec for mode " + std::string(ModeName(mode)));
        }
        codecs_.emplace(mode, std::move(codec));
    }
}

const Registry& Registry::Default() {
    static const Registry registry(MakeDefaultCodecs());
    return registry;
}

const Codec* Registry::Find(Mode mode) const noexcept {
    auto it = codecs_.find(mode);
    return it == codecs_.end() ? nullptr : it->second.get();
}

const Codec& Registry::Get(Mode mode) const {
    const Codec* codec = Find(mode);
    if (!codec) {
        ErrorContext ctx;
        ctx.mode = std::string(ModeName(mode));
        throw UnsupportedModeError("no codec registered for this mode", std::move(ctx));
    }
    return *codec;
}

std::vector<Mode> Registry::Modes() const {
    std::vector<Mode> modes;
    modes.reserve(codecs_.size());
    for (const auto& entry : codecs_) {
        modes.push_back(entry.first);
    }
    return modes;
}

std::vector<std::unique_ptr<Codec>> MakeDefaultCodecs() {
    std::vector<std::unique_ptr<Codec>> codecs;
    codecs.push_back(codecs::MakeBase64());
    codecs.push_back(codecs::MakeBase32());
    codecs.push_back(codecs::MakeBase85());
    codecs.push_back(codecs::MakeBase91());
    codecs.push_back(codecs::MakeHex());
    codecs.push_back(codecs::MakeBinary());
    codecs.push_back(codecs::MakeBraille());
    codecs.push_back(codecs::MakeEmoji());
    codecs.push_back(codecs::MakeUuid());
    codecs.push_back(codecs::MakeZeroWidth());
    codecs.push_back(codecs::MakeImage());
    return codecs;
}

}  // namespace transmute
