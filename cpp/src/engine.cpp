#include "transmute/engine.hpp"

#include "transmute/cipher.hpp"
#include "transmute/crypto.hpp"
#include "transmute/errors.hpp"
#include "transmute/io.hpp"
#include "transmute/log.hpp"

#include <algorithm>
#include <utility>

namespace transmute {

namespace {

constexpr std::string_view kFileStemAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

std::size_t AlignChunk(std::size_t chunk_size, std::size_t group) {
    if (chunk_size == 0) {
        ErrorContext ctx;
        ctx.field = "chunk_size";
        throw Error("chunk size must be positive", std::move(ctx));
    }
    return std::max(group, chunk_size / group * group);
}

std::uint64_t CanonicalLength(std::uint64_t size, const Capabilities& caps) {
    return (size + caps.bytes_per_group - 1) / caps.bytes_per_group * caps.units_per_group;
}

[[noreturn]] void IntegrityFailure(const std::string& detail, std::string_view field) {
    ErrorContext ctx;
    ctx.field = std::string(field);
    throw IntegrityError(detail, std::move(ctx));
}

std::filesystem::path SanitizedName(const std::string& stored) {
    std::string name = stored;
    std::replace(name.begin(), name.end(), '\\', '/');
    std::filesystem::path leaf = std::filesystem::path(name).filename();
    if (leaf.empty() || leaf == "." || leaf == "..") {
        return std::filesystem::path(std::string(constants::kDefaultDecodedName));
    }
    return leaf;
}

std::filesystem::path DirectoryFor(const Job& job) {
    if (!job.output_dir.empty()) {
        return job.output_dir;
    }
    return job.input.parent_path();
}

}  // namespace

std::string_view OperationName(Operation operation) {
    return operation == Operation::kEncode ? "encode" : "decode";
}

std::string_view JobStateName(JobState state) {
    switch (state) {
        case JobState::kCreated:
            return "created";
        case JobState::kReading:
            return "reading";
        case JobState::kEncrypting:
            return "encrypting";
        case JobState::kChunking:
            return "chunking";
        case JobState::kTransforming:
            return "transforming";
        case JobState::kFraming:
            return "framing";
        case JobState::kWriting:
            return "writing";
        case JobState::kCompleted:
            return "completed";
        case JobState::kCancelled:
            return "cancelled";
        case JobState::kFailed:
            return "failed";
    }
    return "unknown";
}

bool IsTerminal(JobState state) {
    return state == JobState::kCompleted || state == JobState::kCancelled || state == JobState::kFailed;
}

// Per-job state machine. Every transition is published on the progress channel.
class Engine::Tracker {
public:
    Tracker(Engine& engine, Operation operation) : engine_(engine) {
        event_.job_id = engine.NextJobId();
        event_.operation = operation;
        event_.state = JobState::kCreated;
        engine_.Emit(event_);
    }

    void Set(JobState state) {
        if (IsTerminal(event_.state)) {
            return;
        }
        event_.state = state;
        engine_.Emit(event_);
    }

    void Progress(std::size_t done, std::size_t total) {
        event_.state = JobState::kTransforming;
        event_.chunks_done = done;
        event_.chunks_total = total;
        engine_.Emit(event_);
    }

    void SetMode(std::string_view mode) { mode_ = std::string(mode); }

    // Runs fn, moving the job to Completed, Cancelled or Failed and tagging errors
    // with the operation and mode.
    template <typename Fn>
    auto Guard(Fn&& fn) -> decltype(fn()) {
        try {
            auto result = fn();
            Set(JobState::kCompleted);
            return result;
        } catch (CancelledError& err) {
            err.Annotate(OperationName(event_.operation), mode_);
            log::Debug("job " + std::to_string(event_.job_id) + " cancelled");
            Set(JobState::kCancelled);
            throw;
        } catch (Error& err) {
            err.Annotate(OperationName(event_.operation), mode_);
            log::Debug("job " + std::to_string(event_.job_id) + " failed: " + err.what());
            Set(JobState::kFailed);
            throw;
        } catch (...) {
            Set(JobState::kFailed);
            throw;
        }
    }

private:
    Engine& engine_;
    ProgressEvent event_;
    std::string mode_;
};

Engine::Engine(const Registry& registry) : registry_(registry) {}

void Engine::SubscribeProgress(ProgressCallback callback) {
    if (!callback) {
        return;
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(callback));
}

void Engine::Cancel(const JobHandle& handle) {
    if (handle) {
        handle->Cancel();
    }
}

void Engine::Emit(const ProgressEvent& event) {
    std::vector<ProgressCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& err) {
            log::Warn(std::string("progress listener threw: ") + err.what());
        }
    }
}

EncodedArtifact Engine::Encode(const Bytes& payload,
                               const std::string& filename,
                               Mode mode,
                               const JobOptions& options,
                               const CancellationToken* cancel) {
    Tracker tracker(*this, Operation::kEncode);
    tracker.SetMode(ModeName(mode));
    return tracker.Guard([&] { return EncodeTracked(payload, filename, mode, options, cancel, tracker); });
}

DecodedPayload Engine::Decode(const Bytes& artifact,
                              const JobOptions& options,
                              const CancellationToken* cancel) {
    Tracker tracker(*this, Operation::kDecode);
    return tracker.Guard([&] { return DecodeTracked(artifact, options, cancel, tracker); });
}

EncodedArtifact Engine::EncodeTracked(const Bytes& payload,
                                      const std::string& filename,
                                      Mode mode,
                                      const JobOptions& options,
                                      const CancellationToken* cancel,
                                      Tracker& tracker) {
    const Codec& codec = registry_.Get(mode);
    const Capabilities caps = codec.capabilities();
    codec.ValidateOptions(options.mode_options);
    if (auto capacity = codec.Capacity(options.mode_options); capacity && payload.size() > *capacity) {
        throw CapacityError("payload of " + std::to_string(payload.size()) +
                            " bytes exceeds capacity of " + std::to_string(*capacity) + " bytes");
    }
    const std::size_t chunk_size = AlignChunk(options.chunk_size, caps.bytes_per_group);
    framing::ValidateFilename(filename, options.charset);

    framing::Header header;
    header.version = std::string(constants::kFormatVersion);
    header.mode = mode;
    header.charset = options.charset;
    header.keyed = !options.key.empty();
    header.filename = filename;
    header.original_size = payload.size();
    header.crc32 = crypto::Crc32Hex(crypto::Crc32(payload));
    header.sha256 = crypto::ToHex(crypto::Sha256(payload));
    header.chunk_size = chunk_size;

    Bytes working = payload;
    if (header.keyed) {
        tracker.Set(JobState::kEncrypting);
        cipher::ApplyInPlace(working, options.key);
    }

    tracker.Set(JobState::kChunking);
    ErrorContext ctx;
    ctx.operation = std::string(OperationName(Operation::kEncode));
    ctx.mode = std::string(codec.name());
    ChunkProcessor processor(chunk_size, cancel, ctx);
    const std::size_t total = ChunkProcessor::CountChunks(working.size(), chunk_size);
    log::Debug("encode[" + std::string(codec.name()) + "] " + std::to_string(working.size()) +
               " bytes in " + std::to_string(total) + " chunk(s)");

    tracker.Progress(0, total);
    Bytes body = processor.Process(
        working,
        [&codec](std::size_t, const Bytes& chunk) { return codec.Represent(chunk).data; },
        [&tracker](std::size_t done, std::size_t count) { tracker.Progress(done, count); });

    tracker.Set(JobState::kFraming);
    EncodedArtifact result;
    result.data = codec.Assemble(framing::WriteHeader(header), body, payload.size(), options.mode_options);
    result.header = std::move(header);
    result.chunks = total;
    return result;
}

DecodedPayload Engine::DecodeTracked(const Bytes& artifact,
                                     const JobOptions& options,
                                     const CancellationToken* cancel,
                                     Tracker& tracker) {
    framing::ParsedArtifact parsed = framing::ReadHeader(artifact, registry_);
    const framing::Header& header = parsed.header;
    tracker.SetMode(ModeName(header.mode));
    const Codec& codec = registry_.Get(header.mode);
    const Capabilities caps = codec.capabilities();

    tracker.Set(JobState::kChunking);
    Bytes canonical = codec.Canonicalize(parsed.remaining, header.original_size);
    const std::uint64_t expected = CanonicalLength(header.original_size, caps);
    if (canonical.size() != expected) {
        IntegrityFailure("payload holds " + std::to_string(canonical.size()) + " units, expected " +
                             std::to_string(expected),
                         "payload");
    }

    const std::size_t chunk_bytes = AlignChunk(options.chunk_size, caps.bytes_per_group);
    const std::size_t chunk_units = chunk_bytes / caps.bytes_per_group * caps.units_per_group;
    ErrorContext ctx;
    ctx.operation = std::string(OperationName(Operation::kDecode));
    ctx.mode = std::string(codec.name());
    ChunkProcessor processor(chunk_units, cancel, ctx);
    const std::size_t total = ChunkProcessor::CountChunks(canonical.size(), chunk_units);

    tracker.Progress(0, total);
    const Mode mode = header.mode;
    Bytes data = processor.Process(
        canonical,
        [&codec, mode](std::size_t, const Bytes& chunk) { return codec.Reconstruct(Representation{mode, chunk}); },
        [&tracker](std::size_t done, std::size_t count) { tracker.Progress(done, count); });
    if (data.size() < header.original_size) {
        IntegrityFailure("reconstructed payload is short", "TMX-SIZE");
    }
    data.resize(static_cast<std::size_t>(header.original_size));

    if (!options.key.empty()) {
        tracker.Set(JobState::kEncrypting);
        cipher::ApplyInPlace(data, options.key);
    }

    if (data.size() != header.original_size) {
        IntegrityFailure("size mismatch", "TMX-SIZE");
    }
    if (crypto::Crc32Hex(crypto::Crc32(data)) != header.crc32) {
        IntegrityFailure(header.keyed && options.key.empty()
                             ? "checksum mismatch (artifact is keyed and no key was given)"
                             : "checksum mismatch",
                         "TMX-CRC32");
    }
    if (crypto::ToHex(crypto::Sha256(data)) != header.sha256) {
        IntegrityFailure("digest mismatch", "TMX-SHA256");
    }

    DecodedPayload result;
    result.header = std::move(parsed.header);
    result.data = std::move(data);
    result.chunks = total;
    return result;
}

ArtifactSummary Engine::Run(const Job& job) {
    Tracker tracker(*this, job.operation);
    if (job.operation == Operation::kEncode) {
        tracker.SetMode(ModeName(job.mode));
        return tracker.Guard([&] { return RunEncode(job, tracker); });
    }
    return tracker.Guard([&] { return RunDecode(job, tracker); });
}

std::future<ArtifactSummary> Engine::RunAsync(Job job) {
    return std::async(std::launch::async, [this, job = std::move(job)] { return Run(job); });
}

ArtifactSummary Engine::RunEncode(const Job& job, Tracker& tracker) {
    // Fail on an unregistered mode before touching the filesystem.
    const Codec& codec = registry_.Get(job.mode);
    codec.ValidateOptions(job.options.mode_options);

    tracker.Set(JobState::kReading);
    Bytes payload = io::ReadFile(job.input);
    std::string filename = job.input.filename().u8string();
    EncodedArtifact artifact = EncodeTracked(payload, filename, job.mode, job.options, job.cancel.get(), tracker);

    std::filesystem::path target = job.output;
    if (target.empty()) {
        std::string stem = job.options.random_filename ? RandomFileStem() : filename;
        std::string extension = codec.capabilities().carrier == Carrier::kImage ? ".png" : ".txt";
        target = DirectoryFor(job) / (stem + extension);
    }
    if (job.cancel && job.cancel->IsCancelled()) {
        throw CancelledError("cancelled before writing");
    }
    tracker.Set(JobState::kWriting);
    io::WriteFileAtomic(target, artifact.data);
    log::Info("wrote " + target.string());

    ArtifactSummary summary;
    summary.location = target;
    summary.operation = Operation::kEncode;
    summary.mode = job.mode;
    summary.original_size = payload.size();
    summary.encoded_size = artifact.data.size();
    summary.chunks = artifact.chunks;
    summary.keyed = artifact.header.keyed;
    return summary;
}

ArtifactSummary Engine::RunDecode(const Job& job, Tracker& tracker) {
    tracker.Set(JobState::kReading);
    Bytes artifact = io::ReadFile(job.input);
    DecodedPayload decoded = DecodeTracked(artifact, job.options, job.cancel.get(), tracker);

    std::filesystem::path target = job.output;
    if (target.empty()) {
        target = DirectoryFor(job) / SanitizedName(decoded.header.filename);
    }
    if (job.cancel && job.cancel->IsCancelled()) {
        throw CancelledError("cancelled before writing");
    }
    tracker.Set(JobState::kWriting);
    io::WriteFileAtomic(target, decoded.data);
    log::Info("wrote " + target.string());

    ArtifactSummary summary;
    summary.location = target;
    summary.operation = Operation::kDecode;
    summary.mode = decoded.header.mode;
    summary.original_size = decoded.data.size();
    summary.encoded_size = artifact.size();
    summary.chunks = decoded.chunks;
    summary.keyed = decoded.header.keyed;
    return summary;
}

framing::Header Engine::Inspect(const std::filesystem::path& artifact) const {
    try {
        return framing::ReadHeader(io::ReadFile(artifact), registry_).header;
    } catch (Error& err) {
        err.Annotate("inspect", "");
        throw;
    }
}

std::string RandomFileStem(std::size_t max_length) {
    if (max_length == 0) {
        max_length = 1;
    }
    std::size_t length = 1 + crypto::RandomBytes(1)[0] % max_length;
    // 248 = 4 * 62; larger bytes are redrawn to keep the alphabet uniform.
    std::string stem;
    stem.reserve(length);
    while (stem.size() < length) {
        for (std::uint8_t byte : crypto::RandomBytes(length)) {
            if (byte < 248 && stem.size() < length) {
                stem.push_back(kFileStemAlphabet[byte % kFileStemAlphabet.size()]);
            }
        }
    }
    return stem;
}

}  // namespace transmute
