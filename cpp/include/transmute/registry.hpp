#pragma once

#include <map>
#include <memory>
#include <vector>

#include "transmute/codec.hpp"

namespace transmute {

// Mode id -> Codec. Built once, never mutated afterwards.
class Registry {
public:
    explicit Registry(std::vector<std::unique_ptr<Codec>> codecs);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    static const Registry& Default();

    const Codec* Find(Mode mode) const noexcept;
    // Throws UnsupportedModeError.
    const Codec& Get(Mode mode) const;
    bool Contains(Mode mode) const noexcept { return Find(mode) != nullptr; }
    std::vector<Mode> Modes() const;

private:
    std::map<Mode, std::unique_ptr<Codec>> codecs_;
};

std::vector<std::unique_ptr<Codec>> MakeDefaultCodecs();

}  // namespace transmute
