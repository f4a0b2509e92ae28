#include "transmute/crypto.hpp"

#include "transmute/errors.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <zlib.h>

#include <algorithm>
#include <limits>

namespace transmute::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw Error(message);
    }
}

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

Bytes Sha256(const Bytes& data) {
    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    Ensure(EVP_Digest(data.data(), data.size(), out.data(), &out_len, EVP_sha256(), nullptr) == 1,
           "SHA-256 digest failed");
    out.resize(out_len);
    return out;
}

std::uint32_t Crc32(const Bytes& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    std::size_t offset = 0;
    // crc32() takes a uInt length; feed large buffers in slices.
    constexpr std::size_t kSlice = std::numeric_limits<uInt>::max();
    while (offset < data.size()) {
        std::size_t len = std::min(kSlice, data.size() - offset);
        crc = crc32(crc, data.data() + offset, static_cast<uInt>(len));
        offset += len;
    }
    return static_cast<std::uint32_t>(crc);
}

std::string ToHex(const Bytes& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return out;
}

std::string Crc32Hex(std::uint32_t crc) {
    std::string out(8, '0');
    for (int i = 7; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = kHexDigits[crc & 0x0F];
        crc >>= 4;
    }
    return out;
}

}  // namespace transmute::crypto
