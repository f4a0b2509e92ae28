#include "transmute/cipher.hpp"

namespace transmute::cipher {

void ApplyInPlace(Bytes& data, const Bytes& key, std::size_t offset) {
    if (key.empty()) {
        return;
    }
    const std::size_t key_len = key.size();
    std::size_t k = offset % key_len;
    for (std::uint8_t& byte : data) {
        byte ^= key[k];
        if (++k == key_len) {
            k = 0;
        }
    }
}

Bytes Apply(const Bytes& data, const Bytes& key) {
    Bytes out = data;
    ApplyInPlace(out, key);
    return out;
}

Bytes Reverse(const Bytes& data, const Bytes& key) {
    return Apply(data, key);
}

}  // namespace transmute::cipher
