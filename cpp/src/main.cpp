#include "transmute/cli_colors.hpp"
#include "transmute/engine.hpp"
#include "transmute/errors.hpp"
#include "transmute/log.hpp"
#include "transmute/progress.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  transmute_cli version\n";
    std::cout << "  transmute_cli modes\n";
    std::cout << "  transmute_cli info <artifact>\n";
    std::cout << "  transmute_cli encode <file> --mode <id> [--key <k>] [--charset <c>] [--out <path>|--out-dir <dir>] [--random-name] [--chunk-size <n>] [--opt k=v]...\n";
    std::cout << "  transmute_cli decode <artifact> [--key <k>] [--out <path>|--out-dir <dir>] [--chunk-size <n>]\n";
    std::cout << "Global flags: --no-color --quiet --verbose\n";
}

struct JobArgs {
    std::string input;
    std::string mode;
    std::string key;
    std::string charset;
    std::string output;
    std::string output_dir;
    bool random_name = false;
    std::size_t chunk_size = transmute::constants::ChunkSize();
    transmute::OptionMap mode_options;
    bool quiet = false;
};

std::string NextValue(int argc, char** argv, int& idx, const std::string& what) {
    if (idx + 1 >= argc) {
        throw UsageError("Missing " + what);
    }
    idx += 2;
    return argv[idx - 1];
}

JobArgs ParseJobArgs(int argc, char** argv, int start_index, bool encode) {
    JobArgs opts;
    if (start_index >= argc) {
        throw UsageError("Missing input path");
    }
    opts.input = argv[start_index];
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--key" || flag == "-k") {
            opts.key = NextValue(argc, argv, idx, "key value");
        } else if (flag == "--out" || flag == "-o") {
            opts.output = NextValue(argc, argv, idx, "output path");
        } else if (flag == "--out-dir") {
            opts.output_dir = NextValue(argc, argv, idx, "output directory");
        } else if (flag == "--chunk-size") {
            std::string value = NextValue(argc, argv, idx, "chunk size");
            try {
                opts.chunk_size = static_cast<std::size_t>(std::stoull(value));
            } catch (const std::exception&) {
                throw UsageError("Invalid chunk size: " + value);
            }
            if (opts.chunk_size == 0) {
                throw UsageError("Chunk size must be positive");
            }
        } else if (flag == "--quiet" || flag == "-q") {
            opts.quiet = true;
            idx += 1;
        } else if (encode && (flag == "--mode" || flag == "-m")) {
            opts.mode = NextValue(argc, argv, idx, "mode");
        } else if (encode && flag == "--charset") {
            opts.charset = NextValue(argc, argv, idx, "charset");
        } else if (encode && flag == "--random-name") {
            opts.random_name = true;
            idx += 1;
        } else if (encode && flag == "--opt") {
            std::string pair = NextValue(argc, argv, idx, "option");
            std::size_t eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw UsageError("Options take the form key=value: " + pair);
            }
            opts.mode_options[pair.substr(0, eq)] = pair.substr(eq + 1);
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    if (!opts.output.empty() && !opts.output_dir.empty()) {
        throw UsageError("--out and --out-dir are mutually exclusive");
    }
    return opts;
}

transmute::Job BuildJob(const JobArgs& args, transmute::Operation operation) {
    transmute::Job job;
    job.operation = operation;
    job.input = args.input;
    job.output = args.output;
    job.output_dir = args.output_dir;
    job.options.key.assign(args.key.begin(), args.key.end());
    job.options.random_filename = args.random_name;
    job.options.chunk_size = args.chunk_size;
    job.options.mode_options = args.mode_options;
    if (operation == transmute::Operation::kEncode) {
        if (args.mode.empty()) {
            throw UsageError("encode requires --mode");
        }
        auto mode = transmute::ParseMode(args.mode);
        if (!mode) {
            throw transmute::UnsupportedModeError("unknown mode '" + args.mode + "'");
        }
        job.mode = *mode;
        if (!args.charset.empty()) {
            auto charset = transmute::framing::ParseCharset(args.charset);
            if (!charset) {
                throw UsageError("Unknown charset: " + args.charset);
            }
            job.options.charset = *charset;
        }
    }
    return job;
}

int RunJob(const JobArgs& args, transmute::Operation operation) {
    transmute::Job job = BuildJob(args, operation);
    transmute::Engine engine;
    transmute::cli::ProgressReporter reporter;
    if (!args.quiet) {
        engine.SubscribeProgress([&reporter](const transmute::ProgressEvent& event) { reporter.Update(event); });
    }
    transmute::ArtifactSummary summary;
    try {
        summary = engine.Run(job);
    } catch (const std::exception&) {
        reporter.Finish();
        throw;
    }
    reporter.Finish();
    std::cout << summary.location.string() << "\n";
    if (!args.quiet) {
        std::cerr << transmute::cli::Green(std::string(transmute::OperationName(summary.operation)) + "d")
                  << " " << transmute::ModeName(summary.mode) << ": " << summary.original_size
                  << " bytes -> " << summary.encoded_size << " bytes in " << summary.chunks
                  << " chunk(s)" << (summary.keyed ? " [keyed]" : "") << "\n";
    }
    return 0;
}

void PrintModes() {
    const auto& registry = transmute::Registry::Default();
    for (transmute::Mode mode : registry.Modes()) {
        const transmute::Codec& codec = registry.Get(mode);
        auto caps = codec.capabilities();
        std::cout << codec.name() << "\t" << caps.bytes_per_group << " -> " << caps.units_per_group
                  << (caps.carrier == transmute::Carrier::kImage ? "\timage" : "\ttext");
        if (caps.max_payload) {
            std::cout << "\tmax " << *caps.max_payload << " bytes";
        }
        if (!caps.option_keys.empty()) {
            std::cout << "\toptions:";
            for (const auto& key : caps.option_keys) {
                std::cout << " " << key;
            }
        }
        std::cout << "\n";
    }
}

void PrintInfo(const std::string& path) {
    transmute::Engine engine;
    transmute::framing::Header header = engine.Inspect(path);
    std::cout << "version: " << header.version << "\n";
    std::cout << "mode: " << transmute::ModeName(header.mode) << "\n";
    std::cout << "charset: " << transmute::framing::CharsetName(header.charset) << "\n";
    std::cout << "keyed: " << (header.keyed ? "yes" : "no") << "\n";
    std::cout << "filename: " << header.filename << "\n";
    std::cout << "size: " << header.original_size << " bytes\n";
    std::cout << "crc32: " << header.crc32 << "\n";
    std::cout << "sha256: " << header.sha256 << "\n";
    std::cout << "chunk_size: " << header.chunk_size << "\n";
}

// Global flags may appear anywhere; they are stripped before command parsing.
std::vector<char*> StripGlobalFlags(int argc, char** argv) {
    std::vector<char*> rest;
    for (int i = 0; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--no-color") {
            transmute::cli::SetColorsEnabled(false);
        } else if (arg == "--verbose" || arg == "-v") {
            transmute::log::SetVerbose(true);
        } else {
            if (arg == "--quiet" || arg == "-q") {
                transmute::log::SetQuiet(true);
            }
            rest.push_back(argv[i]);
        }
    }
    return rest;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<char*> args = StripGlobalFlags(argc, argv);
    argc = static_cast<int>(args.size());
    argv = args.data();
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        if (command == "version" || command == "--version") {
            std::cout << "transmute " << transmute::constants::kEngineVersion << " (format "
                      << transmute::constants::kFormatVersion << ")\n";
            return 0;
        }
        if (command == "modes") {
            PrintModes();
            return 0;
        }
        if (command == "info") {
            if (argc < 3) {
                PrintUsage();
                return 2;
            }
            PrintInfo(argv[2]);
            return 0;
        }
        if (command == "encode") {
            return RunJob(ParseJobArgs(argc, argv, 2, true), transmute::Operation::kEncode);
        }
        if (command == "decode") {
            return RunJob(ParseJobArgs(argc, argv, 2, false), transmute::Operation::kDecode);
        }
        PrintUsage();
        return 2;
    } catch (const UsageError& exc) {
        transmute::log::Error(exc.what());
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        transmute::log::Error(exc.what());
        return 1;
    }
}
