#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace transmute::env {

// Empty when unset.
std::string Get(std::string_view name);
bool IsSet(std::string_view name);

// 1/true/yes/on enable, 0/false/no/off disable; anything else is default_value.
bool IsEnabled(std::string_view name, bool default_value = false);

// A positive decimal integer, or nullopt when unset, malformed or zero.
std::optional<std::uint64_t> GetPositive(std::string_view name);

}  // namespace transmute::env
