#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace transmute {

// Where a failure happened. Empty fields are omitted from what().
struct ErrorContext {
    std::string operation;
    std::string mode;
    std::optional<std::size_t> chunk;
    std::string field;
};

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& detail, ErrorContext context = {});

    const char* what() const noexcept override { return rendered_.c_str(); }
    const std::string& detail() const noexcept { return detail_; }
    const ErrorContext& context() const noexcept { return context_; }

    // Fills operation and mode if they are still unset.
    void Annotate(std::string_view operation, std::string_view mode);

private:
    void Render();

    std::string detail_;
    ErrorContext context_;
    std::string rendered_;
};

class UnsupportedModeError : public Error {
public:
    using Error::Error;
};

class MalformedHeaderError : public Error {
public:
    using Error::Error;
};

class IntegrityError : public Error {
public:
    using Error::Error;
};

class CapacityError : public Error {
public:
    using Error::Error;
};

class CancelledError : public Error {
public:
    using Error::Error;
};

class IoError : public Error {
public:
    using Error::Error;
};

// A single chunk's transform failed; the whole job is aborted.
class ChunkError : public Error {
public:
    ChunkError(std::size_t index, const std::string& detail, ErrorContext context = {});

    std::size_t index() const noexcept { return index_; }

private:
    std::size_t index_;
};

}  // namespace transmute
