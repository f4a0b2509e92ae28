#include "transmute/chunk_processor.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace transmute {

ChunkProcessor::ChunkProcessor(std::size_t chunk_size,
                               const CancellationToken* cancel,
                               ErrorContext context)
    : chunk_size_(chunk_size), cancel_(cancel), context_(std::move(context)) {
    if (chunk_size_ == 0) {
        ErrorContext ctx = context_;
        ctx.field = "chunk_size";
        throw Error("chunk size must be positive", ctx);
    }
}

std::size_t ChunkProcessor::CountChunks(std::size_t input_size, std::size_t chunk_size) {
    if (input_size == 0) {
        return 1;
    }
    return (input_size + chunk_size - 1) / chunk_size;
}

void ChunkProcessor::CheckCancelled() const {
    if (cancel_ && cancel_->IsCancelled()) {
        throw CancelledError("cancelled by request", context_);
    }
}

ChunkProcessor::Bytes ChunkProcessor::Process(const Bytes& input,
                                              const TransformFn& transform,
                                              const ProgressFn& progress) const {
    const std::size_t total = CountChunks(input.size(), chunk_size_);
    Bytes output;
    Bytes chunk;
    for (std::size_t index = 0; index < total; ++index) {
        CheckCancelled();

        std::size_t begin = index * chunk_size_;
        std::size_t end = std::min(input.size(), begin + chunk_size_);
        chunk.assign(input.begin() + static_cast<std::ptrdiff_t>(begin),
                     input.begin() + static_cast<std::ptrdiff_t>(end));

        Bytes piece;
        try {
            piece = transform(index, chunk);
        } catch (const CancelledError&) {
            throw;
        } catch (const std::exception& exc) {
            const auto* error = dynamic_cast<const Error*>(&exc);
            throw ChunkError(index, error ? error->detail() : std::string(exc.what()), context_);
        }
        if (index == 0) {
            // Representations are rarely smaller than their source.
            output.reserve(piece.size() * total);
        }
        output.insert(output.end(), piece.begin(), piece.end());

        if (progress) {
            progress(index + 1, total);
        }
    }
    CheckCancelled();
    return output;
}

}  // namespace transmute
