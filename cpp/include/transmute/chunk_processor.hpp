#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "transmute/errors.hpp"

namespace transmute {

class CancellationToken {
public:
    void Cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

using JobHandle = std::shared_ptr<CancellationToken>;

class ChunkProcessor {
public:
    using Bytes = std::vector<std::uint8_t>;
    using TransformFn = std::function<Bytes(std::size_t index, const Bytes& chunk)>;
    using ProgressFn = std::function<void(std::size_t done, std::size_t total)>;

    explicit ChunkProcessor(std::size_t chunk_size,
                            const CancellationToken* cancel = nullptr,
                            ErrorContext context = {});

    // Runs transform over consecutive chunk_size slices of input in order and
    // concatenates the results. An empty input is one empty chunk.
    Bytes Process(const Bytes& input,
                  const TransformFn& transform,
                  const ProgressFn& progress = {}) const;

    std::size_t chunk_size() const noexcept { return chunk_size_; }

    static std::size_t CountChunks(std::size_t input_size, std::size_t chunk_size);

private:
    void CheckCancelled() const;

    std::size_t chunk_size_;
    const CancellationToken* cancel_;
    ErrorContext context_;
};

}  // namespace transmute
