#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transmute {

using Bytes = std::vector<std::uint8_t>;
using OptionMap = std::map<std::string, std::string>;

enum class Mode : std::uint8_t {
    kBase64,
    kBase32,
    kBase85,
    kBase91,
    kHex,
    kBinary,
    kBraille,
    kEmoji,
    kUuid,
    kZeroWidth,
    kImage,
};

std::string_view ModeName(Mode mode);
std::optional<Mode> ParseMode(std::string_view name);
const std::vector<Mode>& AllModes();

enum class Carrier {
    kText,
    kImage,
};

struct Capabilities {
    // bytes_per_group source bytes become units_per_group bytes of canonical representation.
    std::size_t bytes_per_group = 1;
    std::size_t units_per_group = 1;
    bool supports_binary_passthrough = true;
    Carrier carrier = Carrier::kText;
    std::optional<std::size_t> max_payload;
    std::vector<std::string> option_keys;
};

struct Representation {
    Mode mode = Mode::kBase64;
    Bytes data;
};

// A reversible byte transform. Implementations hold only immutable configuration,
// so one instance may serve any number of concurrent jobs.
class Codec {
public:
    virtual ~Codec() = default;

    virtual Mode mode() const = 0;
    virtual Capabilities capabilities() const = 0;

    // chunk holds whole groups except possibly the last chunk of a payload.
    virtual Representation Represent(const Bytes& chunk) const = 0;
    // rep.data holds whole canonical groups; always yields bytes_per_group bytes per group.
    virtual Bytes Reconstruct(const Representation& rep) const = 0;

    // Throws Error naming the offending key.
    virtual void ValidateOptions(const OptionMap& options) const;
    virtual std::optional<std::size_t> Capacity(const OptionMap& options) const;

    // Builds the artifact from the header line and the concatenated representation.
    virtual Bytes Assemble(const std::string& header_line,
                           const Bytes& body,
                           std::size_t payload_size,
                           const OptionMap& options) const;

    // Reduces an artifact's payload region to canonical units, dropping whatever
    // the representation tolerates (whitespace, separators, carrier text).
    virtual Bytes Canonicalize(const Bytes& region, std::size_t payload_size) const;

    std::string_view name() const { return ModeName(mode()); }
};

}  // namespace transmute
