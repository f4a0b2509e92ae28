#include "transmute/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace transmute::env {

namespace {

const char* Lookup(std::string_view name) {
    return std::getenv(std::string(name).c_str());
}

}  // namespace

std::string Get(std::string_view name) {
    const char* value = Lookup(name);
    return value ? std::string(value) : std::string();
}

bool IsSet(std::string_view name) {
    return Lookup(name) != nullptr;
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return default_value;
}

std::optional<std::uint64_t> GetPositive(std::string_view name) {
    std::string value = Get(name);
    if (value.empty() || value.size() > 20) {
        return std::nullopt;
    }
    std::uint64_t result = 0;
    for (char ch : value) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        if (result > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        result = result * 10 + digit;
    }
    if (result == 0) {
        return std::nullopt;
    }
    return result;
}

}  // namespace transmute::env
