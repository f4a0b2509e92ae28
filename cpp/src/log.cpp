#include "transmute/log.hpp"

#include "transmute/cli_colors.hpp"
#include "transmute/constants.hpp"
#include "transmute/env.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace transmute::log {

namespace {

std::atomic<int> g_verbose{-1};
std::atomic<bool> g_quiet{false};
std::mutex g_output_mutex;

void Print(const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << tag << " " << message << "\n";
}

}  // namespace

bool Verbose() {
    int value = g_verbose.load();
    if (value < 0) {
        value = env::IsEnabled(constants::kVerboseEnv) ? 1 : 0;
        g_verbose.store(value);
    }
    return value == 1;
}

void SetVerbose(bool enabled) {
    g_verbose.store(enabled ? 1 : 0);
}

void SetQuiet(bool quiet) {
    g_quiet.store(quiet);
}

void Debug(const std::string& message) {
    if (Verbose()) {
        Print(cli::Dim("[debug]"), message);
    }
}

void Info(const std::string& message) {
    if (Verbose()) {
        Print(cli::Cyan("[info]"), message);
    }
}

void Warn(const std::string& message) {
    if (!g_quiet.load()) {
        Print(cli::Yellow("[warn]"), message);
    }
}

void Error(const std::string& message) {
    Print(cli::BoldRed("Error:"), message);
}

}  // namespace transmute::log
