#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "transmute/chunk_processor.hpp"
#include "transmute/codec.hpp"
#include "transmute/constants.hpp"
#include "transmute/framing.hpp"
#include "transmute/registry.hpp"

namespace transmute {

enum class Operation {
    kEncode,
    kDecode,
};

std::string_view OperationName(Operation operation);

enum class JobState {
    kCreated,
    kReading,
    kEncrypting,
    kChunking,
    kTransforming,
    kFraming,
    kWriting,
    kCompleted,
    kCancelled,
    kFailed,
};

std::string_view JobStateName(JobState state);
bool IsTerminal(JobState state);

struct JobOptions {
    framing::Charset charset = framing::Charset::kUtf8;
    Bytes key;
    bool random_filename = false;
    std::size_t chunk_size = constants::ChunkSize();
    OptionMap mode_options;
};

struct Job {
    Operation operation = Operation::kEncode;
    Mode mode = Mode::kBase64;  // decode reads the mode from the header
    std::filesystem::path input;
    std::filesystem::path output;      // explicit target; wins over output_dir
    std::filesystem::path output_dir;  // defaults to the input's directory
    JobOptions options;
    JobHandle cancel = std::make_shared<CancellationToken>();

    const JobHandle& Handle() const noexcept { return cancel; }
};

struct ArtifactSummary {
    std::filesystem::path location;
    Operation operation = Operation::kEncode;
    Mode mode = Mode::kBase64;
    std::uint64_t original_size = 0;
    std::uint64_t encoded_size = 0;
    std::size_t chunks = 0;
    bool keyed = false;
};

struct ProgressEvent {
    std::uint64_t job_id = 0;
    Operation operation = Operation::kEncode;
    JobState state = JobState::kCreated;
    std::size_t chunks_done = 0;
    std::size_t chunks_total = 0;
};

// Invoked on the thread running the job; must return promptly.
using ProgressCallback = std::function<void(const ProgressEvent&)>;

struct DecodedPayload {
    framing::Header header;
    Bytes data;
    std::size_t chunks = 0;
};

struct EncodedArtifact {
    framing::Header header;
    Bytes data;
    std::size_t chunks = 0;
};

class Engine {
public:
    explicit Engine(const Registry& registry = Registry::Default());

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Throws a transmute::Error subclass on failure; nothing is written then.
    ArtifactSummary Run(const Job& job);
    std::future<ArtifactSummary> RunAsync(Job job);

    void SubscribeProgress(ProgressCallback callback);
    void Cancel(const JobHandle& handle);

    framing::Header Inspect(const std::filesystem::path& artifact) const;

    // In-memory pipelines behind Run.
    EncodedArtifact Encode(const Bytes& payload,
                           const std::string& filename,
                           Mode mode,
                           const JobOptions& options,
                           const CancellationToken* cancel = nullptr);
    DecodedPayload Decode(const Bytes& artifact,
                          const JobOptions& options,
                          const CancellationToken* cancel = nullptr);

    const Registry& registry() const noexcept { return registry_; }

private:
    class Tracker;

    EncodedArtifact EncodeTracked(const Bytes& payload,
                                  const std::string& filename,
                                  Mode mode,
                                  const JobOptions& options,
                                  const CancellationToken* cancel,
                                  Tracker& tracker);
    DecodedPayload DecodeTracked(const Bytes& artifact,
                                 const JobOptions& options,
                                 const CancellationToken* cancel,
                                 Tracker& tracker);

    ArtifactSummary RunEncode(const Job& job, Tracker& tracker);
    ArtifactSummary RunDecode(const Job& job, Tracker& tracker);

    void Emit(const ProgressEvent& event);
    std::uint64_t NextJobId() noexcept { return next_job_id_.fetch_add(1) + 1; }

    const Registry& registry_;
    std::mutex listeners_mutex_;
    std::vector<ProgressCallback> listeners_;
    std::atomic<std::uint64_t> next_job_id_{0};
};

std::string RandomFileStem(std::size_t max_length = constants::kRandomNameMaxLength);

}  // namespace transmute
