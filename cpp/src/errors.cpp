#include "transmute/errors.hpp"

#include <utility>

namespace transmute {

Error::Error(const std::string& detail, ErrorContext context)
    : std::runtime_error(detail), detail_(detail), context_(std::move(context)) {
    Render();
}

void Error::Annotate(std::string_view operation, std::string_view mode) {
    if (context_.operation.empty()) {
        context_.operation = std::string(operation);
    }
    if (context_.mode.empty()) {
        context_.mode = std::string(mode);
    }
    Render();
}

void Error::Render() {
    std::string prefix = context_.operation;
    if (!context_.mode.empty()) {
        prefix += "[" + context_.mode + "]";
    }
    if (context_.chunk.has_value()) {
        if (!prefix.empty()) {
            prefix.push_back(' ');
        }
        prefix += "chunk " + std::to_string(context_.chunk.value());
    }
    if (!context_.field.empty()) {
        if (!prefix.empty()) {
            prefix.push_back(' ');
        }
        prefix += "field " + context_.field;
    }
    rendered_ = prefix.empty() ? detail_ : prefix + ": " + detail_;
}

namespace {

ErrorContext WithChunk(ErrorContext context, std::size_t index) {
    context.chunk = index;
    return context;
}

}  // namespace

ChunkError::ChunkError(std::size_t index, const std::string& detail, ErrorContext context)
    : Error(detail, WithChunk(std::move(context), index)), index_(index) {}

}  // namespace transmute
