#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "test_util.hpp"
#include "transmute/base64.hpp"
#include "transmute/cli_colors.hpp"
#include "transmute/crypto.hpp"
#include "transmute/engine.hpp"
#include "transmute/errors.hpp"
#include "transmute/format.hpp"
#include "transmute/image_codec.hpp"
#include "transmute/io.hpp"
#include "transmute/log.hpp"
#include "transmute/text_codecs.hpp"
#include "transmute/utf8.hpp"
#include "transmute/zero_width.hpp"

namespace fs = std::filesystem;

using transmute::Bytes;
using transmute::Engine;
using transmute::JobOptions;
using transmute::Mode;
using transmute::test::Check;
using transmute::test::Throws;
using transmute::test::ToBytes;
using transmute::test::ToString;

namespace {

JobOptions WithChunk(std::size_t chunk_size) {
    JobOptions options;
    options.chunk_size = chunk_size;
    return options;
}

std::string EscapeJsonValue(const std::string& value) {
    std::string out;
    for (char ch : value) {
        if (ch == '"' || ch == '\\') {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    return out;
}

// Rewrites one JSON field inside a text artifact's header line.
Bytes RewriteHeaderField(const Bytes& artifact, const std::string& key, const std::string& value) {
    auto newline = std::find(artifact.begin(), artifact.end(), '\n');
    std::string line(artifact.begin(), newline);
    std::string json = ToString(transmute::base64::Decode(line.substr(5)).value_or(Bytes{}));
    std::string marker = "\"" + key + "\":\"";
    std::size_t start = json.find(marker) + marker.size();
    std::size_t end = json.find('"', start);
    json.replace(start, end - start, EscapeJsonValue(value));
    std::string rebuilt = line.substr(0, 5) + transmute::base64::Encode(ToBytes(json));
    Bytes out(rebuilt.begin(), rebuilt.end());
    out.insert(out.end(), newline, artifact.end());
    return out;
}

std::string HeaderField(const Bytes& artifact, const std::string& key) {
    auto newline = std::find(artifact.begin(), artifact.end(), '\n');
    std::string line(artifact.begin(), newline);
    std::string json = ToString(transmute::base64::Decode(line.substr(5)).value_or(Bytes{}));
    std::string marker = "\"" + key + "\":\"";
    std::size_t start = json.find(marker) + marker.size();
    return json.substr(start, json.find('"', start) - start);
}

std::string Payload(const Bytes& artifact) {
    auto newline = std::find(artifact.begin(), artifact.end(), '\n');
    return std::string(newline + 1, artifact.end());
}

void TestRoundTrips() {
    std::cout << "Round trips for every mode" << std::endl;
    Engine engine;
    for (Mode mode : engine.registry().Modes()) {
        for (std::size_t size : {0u, 1u, 2u, 3u, 4u, 1023u, 1024u, 1025u}) {
            Bytes input = transmute::test::Pattern(size, static_cast<std::uint32_t>(size));
            std::string label = std::string(transmute::ModeName(mode)) + " " + std::to_string(size) + " bytes";
            auto encoded = engine.Encode(input, "data.bin", mode, JobOptions{});
            auto decoded = engine.Decode(encoded.data, JobOptions{});
            Check(decoded.data == input, label + " round trip");
            Check(decoded.header.mode == mode && decoded.header.filename == "data.bin", label + " header");
        }
    }
}

void TestChunkTransparency() {
    std::cout << "Chunk-boundary transparency" << std::endl;
    Engine engine;
    const Bytes input = transmute::test::Pattern(1025, 9);
    JobOptions keyed;
    keyed.key = ToBytes("k3y");
    for (Mode mode : engine.registry().Modes()) {
        std::string name(transmute::ModeName(mode));
        Bytes reference;
        for (std::size_t chunk : {std::size_t{16}, std::size_t{1024}, input.size()}) {
            auto encoded = engine.Encode(input, "data.bin", mode, WithChunk(chunk));
            for (std::size_t decode_chunk : {std::size_t{16}, std::size_t{1024}, input.size()}) {
                auto decoded = engine.Decode(encoded.data, WithChunk(decode_chunk));
                Check(decoded.data == input, name + " chunk " + std::to_string(chunk) + "/" +
                                                 std::to_string(decode_chunk));
            }
            if (mode != Mode::kImage) {
                if (reference.empty()) {
                    reference = encoded.data;
                }
                Check(Payload(encoded.data) == Payload(reference),
                      name + " representation independent of chunk " + std::to_string(chunk));
            }

            JobOptions keyed_chunk = keyed;
            keyed_chunk.chunk_size = chunk;
            auto sealed = engine.Encode(input, "data.bin", mode, keyed_chunk);
            Check(engine.Decode(sealed.data, keyed).data == input, name + " keyed chunk " + std::to_string(chunk));
        }
    }
}

void TestConcreteScenarios() {
    std::cout << "Concrete scenarios" << std::endl;
    Engine engine;
    auto encoded = engine.Encode(ToBytes("Hi!"), "hi.txt", Mode::kBase64, JobOptions{});
    Check(Payload(encoded.data) == "SGkh", "Hi! encodes to SGkh");
    Check(encoded.header.original_size == 3, "size 3");
    Check(encoded.header.crc32 == transmute::crypto::Crc32Hex(transmute::crypto::Crc32(ToBytes("Hi!"))),
          "crc of Hi!");
    Check(HeaderField(encoded.data, "TMX-MODE") == "base64", "mode on the wire");
    Check(HeaderField(encoded.data, "TMX-SIZE") == "3", "size on the wire");
    Check(HeaderField(encoded.data, "TMX-CRC32") == encoded.header.crc32, "crc on the wire");
    Check(ToString(engine.Decode(encoded.data, JobOptions{}).data) == "Hi!", "SGkh decodes to Hi!");

    Bytes seven = {11, 22, 33, 44, 55, 66, 77};
    auto image = engine.Encode(seven, "seven.bin", Mode::kImage, JobOptions{});
    Check(transmute::format::IsPng(image.data), "image artifact is a PNG");
    Check(transmute::format::FindPngChunk(image.data, "tmXh").has_value(), "header lives in its own chunk");
    auto grid = transmute::codecs::DecodePng(image.data);
    Check(grid.width == 2 && grid.height == 2, "3 pixels lay out as 2x2");
    Check(std::equal(seven.begin(), seven.end(), grid.rgb.begin()), "pixels carry the payload in order");
    Check(grid.rgb.size() == 12 && grid.rgb[7] == 0 && grid.rgb[8] == 0, "unused channels hold the sentinel");
    Check(grid.rgb[9] == 0 && grid.rgb[10] == 0 && grid.rgb[11] == 0, "unused pixel holds the sentinel");
    Check(engine.Decode(image.data, JobOptions{}).data == seven, "sentinels are cut by the stored length");

    Bytes zeros(5, 0);
    auto zero_image = engine.Encode(zeros, "zeros.bin", Mode::kImage, JobOptions{});
    Check(engine.Decode(zero_image.data, JobOptions{}).data == zeros, "payload equal to the sentinel survives");

    auto empty_image = engine.Encode({}, "empty.bin", Mode::kImage, JobOptions{});
    auto empty_grid = transmute::codecs::DecodePng(empty_image.data);
    Check(empty_grid.width == 1 && empty_grid.height == 1, "empty payload is a 1x1 image");
}

void TestCarrierText() {
    std::cout << "Zero-width carrier" << std::endl;
    Engine engine;
    JobOptions options;
    options.mode_options["carrier"] = "Hello world";
    auto encoded = engine.Encode(ToBytes("secret"), "s.txt", Mode::kZeroWidth, options);
    std::string visible;
    for (char32_t cp : transmute::utf8::DecodeLossy(Payload(encoded.data))) {
        if (std::find(transmute::codecs::kZeroWidthAlphabet.begin(), transmute::codecs::kZeroWidthAlphabet.end(),
                      cp) == transmute::codecs::kZeroWidthAlphabet.end()) {
            transmute::utf8::Append(visible, cp);
        }
    }
    Check(visible == "Hello world", "carrier text is preserved");
    Check(Payload(encoded.data).rfind("H", 0) == 0, "hidden run follows the first character");

    Bytes edited = encoded.data;
    std::string extra = " -- edited by hand";
    edited.insert(edited.end(), extra.begin(), extra.end());
    Check(ToString(engine.Decode(edited, JobOptions{}).data) == "secret", "carrier edits do not matter");
}

void TestIntegrity() {
    std::cout << "Integrity" << std::endl;
    Engine engine;
    const Bytes input = transmute::test::Pattern(300, 5);
    auto encoded = engine.Encode(input, "p.bin", Mode::kBase64, JobOptions{});

    // Every single-bit flip of every checksum character is an integrity failure on that field.
    for (const std::string key : {"TMX-CRC32", "TMX-SHA256"}) {
        const std::string digest = HeaderField(encoded.data, key);
        std::size_t caught = 0;
        std::size_t tries = 0;
        for (std::size_t i = 0; i < digest.size(); ++i) {
            for (int bit = 0; bit < 8; ++bit) {
                std::string flipped = digest;
                flipped[i] = static_cast<char>(static_cast<unsigned char>(flipped[i]) ^ (1u << bit));
                ++tries;
                try {
                    engine.Decode(RewriteHeaderField(encoded.data, key, flipped), JobOptions{});
                } catch (const transmute::IntegrityError& err) {
                    if (err.context().field == key) {
                        ++caught;
                    }
                } catch (const transmute::Error& err) {
                    std::cerr << "  " << key << " char " << i << " bit " << bit << ": " << err.what() << "\n";
                }
            }
        }
        Check(tries == digest.size() * 8 && caught == tries, key + " bit flips are integrity failures");
    }

    Check(Throws<transmute::UnsupportedModeError>(
              [&] { engine.Decode(RewriteHeaderField(encoded.data, "TMX-MODE", "morse"), JobOptions{}); },
              "morse"),
          "unregistered mode id");

    Check(Throws<transmute::IntegrityError>(
              [&] { engine.Decode(RewriteHeaderField(encoded.data, "TMX-SIZE", "299"), JobOptions{}); }, "size"),
          "size tamper");

    Bytes body_tamper = encoded.data;
    body_tamper.back() = body_tamper.back() == 'A' ? 'B' : 'A';
    Check(Throws<transmute::IntegrityError>([&] { engine.Decode(body_tamper, JobOptions{}); }, "payload"),
          "payload tamper");

    Bytes short_body(encoded.data.begin(), encoded.data.end() - 4);
    try {
        engine.Decode(short_body, JobOptions{});
        Check(false, "truncated payload must fail");
    } catch (const transmute::IntegrityError& err) {
        Check(err.context().field == "payload", "truncation names the payload");
    }

    Bytes bad_symbol = encoded.data;
    bad_symbol[bad_symbol.size() - 10] = '%';
    try {
        engine.Decode(bad_symbol, WithChunk(30));
        Check(false, "foreign symbol must fail");
    } catch (const transmute::ChunkError& err) {
        Check(std::string(err.what()).rfind("decode[base64] chunk ", 0) == 0, "chunk error carries context");
    }
}

void TestCharsetLeavesPayloadAlone() {
    std::cout << "Charset affects the header only" << std::endl;
    Engine engine;
    const Bytes input = transmute::test::Pattern(97, 4);
    JobOptions utf8;
    utf8.charset = transmute::framing::Charset::kUtf8;
    JobOptions latin1;
    latin1.charset = transmute::framing::Charset::kLatin1;
    for (Mode mode : engine.registry().Modes()) {
        if (engine.registry().Get(mode).capabilities().carrier != transmute::Carrier::kText) {
            continue;
        }
        std::string name(transmute::ModeName(mode));
        auto as_utf8 = engine.Encode(input, "caf\xc3\xa9.bin", mode, utf8);
        auto as_latin1 = engine.Encode(input, "caf\xc3\xa9.bin", mode, latin1);
        Check(HeaderField(as_utf8.data, "TMX-CHARSET") == "utf-8" &&
                  HeaderField(as_latin1.data, "TMX-CHARSET") == "latin-1",
              name + " charset recorded");
        Check(HeaderField(as_utf8.data, "TMX-NAME") != HeaderField(as_latin1.data, "TMX-NAME"),
              name + " filename bytes follow the charset");
        Check(Payload(as_utf8.data) == Payload(as_latin1.data), name + " payload identical across charsets");

        auto back_utf8 = engine.Decode(as_utf8.data, JobOptions{});
        auto back_latin1 = engine.Decode(as_latin1.data, JobOptions{});
        Check(back_utf8.data == input && back_latin1.data == input, name + " both charsets decode");
        Check(back_utf8.header.filename == "caf\xc3\xa9.bin" && back_latin1.header.filename == "caf\xc3\xa9.bin",
              name + " filename restored");
    }

    JobOptions ascii;
    ascii.charset = transmute::framing::Charset::kAscii;
    try {
        engine.Encode(input, "caf\xc3\xa9.bin", Mode::kHex, ascii);
        Check(false, "ascii cannot name caf\xc3\xa9.bin");
    } catch (const transmute::MalformedHeaderError& err) {
        Check(err.context().operation == "encode" && err.context().field == "TMX-NAME",
              "unrepresentable filename fails the encode job");
    }
}

void TestConcurrentJobs() {
    std::cout << "Concurrent jobs" << std::endl;
    const bool was_verbose = transmute::log::Verbose();
    transmute::log::SetVerbose(true);

    constexpr std::size_t kWorkers = 4;
    std::vector<char> ok(kWorkers, 0);
    std::vector<std::thread> workers;
    for (std::size_t w = 0; w < kWorkers; ++w) {
        workers.emplace_back([w, &ok] {
            Engine engine;
            Bytes input = transmute::test::Pattern(256 + w, static_cast<std::uint32_t>(w));
            bool good = true;
            for (int round = 0; round < 8 && good; ++round) {
                transmute::cli::ColorsEnabled(std::cerr);
                auto encoded = engine.Encode(input, "w.bin", Mode::kHex, WithChunk(64));
                good = engine.Decode(encoded.data, WithChunk(64)).data == input;
            }
            ok[w] = good ? 1 : 0;
        });
    }
    for (int i = 0; i < 16; ++i) {
        transmute::cli::SetColorsEnabled(i % 2 == 0);
    }
    for (auto& worker : workers) {
        worker.join();
    }
    transmute::cli::SetColorsEnabled(false);
    transmute::log::SetVerbose(was_verbose);

    Check(std::all_of(ok.begin(), ok.end(), [](char v) { return v == 1; }),
          "parallel engines log and round trip independently");
}

void TestKeys() {
    std::cout << "Keys" << std::endl;
    Engine engine;
    const Bytes input = transmute::test::Pattern(200, 2);
    JobOptions keyed;
    keyed.key = ToBytes("correct horse");
    auto sealed = engine.Encode(input, "k.bin", Mode::kHex, keyed);
    Check(sealed.header.keyed && HeaderField(sealed.data, "TMX-KEYED") == "yes", "keyed flag set");
    Check(engine.Decode(sealed.data, keyed).data == input, "right key");

    JobOptions wrong;
    wrong.key = ToBytes("battery staple");
    Check(Throws<transmute::IntegrityError>([&] { engine.Decode(sealed.data, wrong); }, "wrong key"),
          "wrong key is an integrity failure");
    Check(Throws<transmute::IntegrityError>([&] { engine.Decode(sealed.data, JobOptions{}); }, "no key"),
          "missing key is an integrity failure");

    auto plain = engine.Encode(input, "k.bin", Mode::kHex, JobOptions{});
    Check(!plain.header.keyed && HeaderField(plain.data, "TMX-KEYED") == "no", "empty key leaves flag off");
    Check(Payload(plain.data) != Payload(sealed.data), "key changes the representation");
}

void TestCapacity() {
    std::cout << "Capacity" << std::endl;
    Engine engine;
    JobOptions options;
    options.mode_options["max-side"] = "2";
    auto at_limit = engine.Encode(transmute::test::Pattern(12), "c.bin", Mode::kImage, options);
    Check(engine.Decode(at_limit.data, JobOptions{}).data == transmute::test::Pattern(12), "exactly at capacity");
    Check(Throws<transmute::CapacityError>(
              [&] { engine.Encode(transmute::test::Pattern(13), "c.bin", Mode::kImage, options); }, "capacity"),
          "one byte over capacity");
}

void TestCancellation() {
    std::cout << "Cancellation" << std::endl;
    Engine engine;
    transmute::CancellationToken token;
    token.Cancel();
    Check(Throws<transmute::CancelledError>(
              [&] { engine.Encode(transmute::test::Pattern(64), "x", Mode::kHex, WithChunk(16), &token); },
              "pre-cancelled"),
          "pre-cancelled encode");

    Engine watched;
    transmute::CancellationToken midway;
    std::vector<transmute::JobState> states;
    watched.SubscribeProgress([&](const transmute::ProgressEvent& event) {
        states.push_back(event.state);
        if (event.state == transmute::JobState::kTransforming && event.chunks_done == 2) {
            midway.Cancel();
        }
    });
    Check(Throws<transmute::CancelledError>(
              [&] { watched.Encode(transmute::test::Pattern(1025), "x", Mode::kBase32, WithChunk(16), &midway); },
              "midway"),
          "cancellation between chunks");
    Check(!states.empty() && states.back() == transmute::JobState::kCancelled, "job ends Cancelled");
}

void TestProgressEvents() {
    std::cout << "Progress events" << std::endl;
    Engine engine;
    std::vector<transmute::ProgressEvent> events;
    engine.SubscribeProgress([&](const transmute::ProgressEvent& event) { events.push_back(event); });
    JobOptions options = WithChunk(100);
    options.key = ToBytes("k");
    engine.Encode(transmute::test::Pattern(1000), "x", Mode::kBase91, options);

    Check(!events.empty() && events.front().state == transmute::JobState::kCreated, "starts Created");
    Check(!events.empty() && events.back().state == transmute::JobState::kCompleted, "ends Completed");
    bool saw_encrypting = false;
    bool saw_framing = false;
    std::size_t max_done = 0;
    std::size_t total = 0;
    for (const auto& event : events) {
        saw_encrypting = saw_encrypting || event.state == transmute::JobState::kEncrypting;
        saw_framing = saw_framing || event.state == transmute::JobState::kFraming;
        if (event.state == transmute::JobState::kTransforming) {
            max_done = std::max(max_done, event.chunks_done);
            total = event.chunks_total;
        }
    }
    Check(saw_encrypting && saw_framing, "intermediate states reported");
    Check(total > 0 && max_done == total, "progress reaches total");
    bool same_job = std::all_of(events.begin(), events.end(),
                                [&](const transmute::ProgressEvent& e) { return e.job_id == events.front().job_id; });
    Check(same_job, "events share the job id");

    std::vector<std::unique_ptr<transmute::Codec>> codecs;
    codecs.push_back(transmute::codecs::MakeBase64());
    transmute::Registry narrow(std::move(codecs));
    Engine limited(narrow);
    Check(Throws<transmute::UnsupportedModeError>(
              [&] { limited.Encode(ToBytes("x"), "x", Mode::kHex, JobOptions{}); }, "unsupported"),
          "unregistered encode mode");
}

fs::path MakeScratchDir() {
    fs::path dir = fs::temp_directory_path() / ("transmute_test_" + transmute::RandomFileStem(16));
    fs::create_directories(dir);
    return dir;
}

bool HasTempLeftovers(const fs::path& dir) {
    for (const auto& entry : fs::directory_iterator(dir)) {
        std::string name = entry.path().filename().string();
        if (name.size() >= 5 && name.compare(name.size() - 5, 5, "._tmp") == 0) {
            return true;
        }
    }
    return false;
}

void TestFileJobs() {
    std::cout << "File jobs" << std::endl;
    fs::path dir = MakeScratchDir();
    fs::path source = dir / "notes.md";
    const Bytes content = transmute::test::Pattern(5000, 11);
    transmute::io::WriteFileAtomic(source, content);

    Engine engine;
    fs::path encoded_dir = dir / "encoded";
    fs::path decoded_dir = dir / "decoded";
    fs::create_directories(encoded_dir);
    fs::create_directories(decoded_dir);

    transmute::Job encode;
    encode.operation = transmute::Operation::kEncode;
    encode.mode = Mode::kBraille;
    encode.input = source;
    encode.output_dir = encoded_dir;
    encode.options.key = ToBytes("pw");
    encode.options.chunk_size = 512;
    auto summary = engine.Run(encode);
    Check(summary.location == encoded_dir / "notes.md.txt", "encode output name");
    Check(summary.original_size == content.size() && summary.keyed, "encode summary");
    Check(summary.chunks == 10, "5000 bytes in 512-byte chunks");

    transmute::Job decode;
    decode.operation = transmute::Operation::kDecode;
    decode.input = summary.location;
    decode.output_dir = decoded_dir;
    decode.options.key = ToBytes("pw");
    auto decoded = engine.Run(decode);
    Check(decoded.location == decoded_dir / "notes.md", "decode restores the stored filename");
    Check(transmute::io::ReadFile(decoded.location) == content, "file round trip");
    Check(decoded.mode == Mode::kBraille, "decode reports the header mode");

    transmute::Job image = encode;
    image.mode = Mode::kImage;
    image.options.random_filename = true;
    auto image_summary = engine.Run(image);
    std::string stem = image_summary.location.stem().string();
    Check(image_summary.location.extension() == ".png", "image artifacts are .png");
    Check(!stem.empty() && stem.size() <= 16 &&
              std::all_of(stem.begin(), stem.end(), [](char c) { return std::isalnum(static_cast<unsigned char>(c)); }),
          "random stem is 1..16 alphanumerics");

    transmute::Job image_decode = decode;
    image_decode.input = image_summary.location;
    image_decode.output = dir / "from_image.bin";
    Check(transmute::io::ReadFile(engine.Run(image_decode).location) == content, "image file round trip");

    transmute::Job wrong = decode;
    wrong.output = dir / "wrong.bin";
    wrong.options.key = ToBytes("nope");
    Check(Throws<transmute::IntegrityError>([&] { engine.Run(wrong); }, "wrong key run"), "wrong key run fails");
    Check(!fs::exists(dir / "wrong.bin"), "failed decode writes nothing");

    transmute::Job missing = encode;
    missing.input = dir / "does-not-exist";
    Check(Throws<transmute::IoError>([&] { engine.Run(missing); }, "missing input"), "missing input is IoError");

    std::vector<std::unique_ptr<transmute::Codec>> codecs;
    codecs.push_back(transmute::codecs::MakeBase64());
    transmute::Registry narrow(std::move(codecs));
    Engine limited(narrow);
    transmute::Job unsupported = missing;
    unsupported.mode = Mode::kHex;
    Check(Throws<transmute::UnsupportedModeError>([&] { limited.Run(unsupported); }, "mode before io"),
          "unsupported mode fails before reading input");

    transmute::Job cancelled = encode;
    cancelled.output = dir / "cancelled.txt";
    cancelled.cancel = std::make_shared<transmute::CancellationToken>();
    engine.Cancel(cancelled.Handle());
    Check(Throws<transmute::CancelledError>([&] { engine.Run(cancelled); }, "cancelled run"), "cancelled run");
    Check(!fs::exists(dir / "cancelled.txt"), "cancelled job writes nothing");

    transmute::Job async_job = decode;
    async_job.output = dir / "async.bin";
    auto future = engine.RunAsync(async_job);
    Check(transmute::io::ReadFile(future.get().location) == content, "async job completes");

    auto evil = engine.Encode(ToBytes("x"), "../../etc/passwd", Mode::kHex, JobOptions{});
    fs::path evil_path = dir / "evil.txt";
    transmute::io::WriteFileAtomic(evil_path, evil.data);
    transmute::Job evil_decode;
    evil_decode.operation = transmute::Operation::kDecode;
    evil_decode.input = evil_path;
    evil_decode.output_dir = decoded_dir;
    Check(engine.Run(evil_decode).location == decoded_dir / "passwd", "stored path components are stripped");

    Check(engine.Inspect(summary.location).filename == "notes.md", "inspect reads the header only");
    Check(!HasTempLeftovers(dir) && !HasTempLeftovers(encoded_dir) && !HasTempLeftovers(decoded_dir),
          "no temporary files remain");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

}  // namespace

int main() {
    TestRoundTrips();
    TestChunkTransparency();
    TestConcreteScenarios();
    TestCarrierText();
    TestIntegrity();
    TestCharsetLeavesPayloadAlone();
    TestKeys();
    TestCapacity();
    TestCancellation();
    TestProgressEvents();
    TestFileJobs();
    TestConcurrentJobs();
    return transmute::test::Summary("test_engine");
}
