#include "transmute/cli_colors.hpp"

#include "transmute/env.hpp"

#include <atomic>
#include <cstdio>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #include <windows.h>
    #define isatty _isatty
    #define fileno _fileno

    #ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
        #define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
    #endif
#else
    #include <unistd.h>
#endif

namespace transmute::cli {

namespace {
    constexpr int kNoOverride = -1;

    // --no-color overrides detection for both streams. Jobs log from their own threads.
    std::atomic<int> g_override{kNoOverride};

#if defined(_WIN32) || defined(_WIN64)
    bool EnableWindowsAnsiColors(DWORD handle_id) {
        HANDLE handle = GetStdHandle(handle_id);
        if (handle == INVALID_HANDLE_VALUE) {
            return false;
        }

        DWORD mode = 0;
        if (!GetConsoleMode(handle, &mode)) {
            return false;
        }

        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(handle, mode) != 0;
    }
#endif

    bool DetectTerminal(std::FILE* stream) {
        if (isatty(fileno(stream)) == 0) {
            return false;
        }
#if defined(_WIN32) || defined(_WIN64)
        return EnableWindowsAnsiColors(stream == stdout ? STD_OUTPUT_HANDLE : STD_ERROR_HANDLE);
#else
        return true;
#endif
    }
}

bool ColorsEnabled(std::ostream& os) {
    int forced = g_override.load(std::memory_order_relaxed);
    if (forced != kNoOverride) {
        return forced != 0;
    }
    if (env::IsSet("NO_COLOR")) {
        return false;
    }
    // Each stream is probed once; static initialization is thread-safe.
    if (&os == &std::cout) {
        static const bool stdout_tty = DetectTerminal(stdout);
        return stdout_tty;
    }
    if (&os == &std::cerr) {
        static const bool stderr_tty = DetectTerminal(stderr);
        return stderr_tty;
    }
    return false;
}

void SetColorsEnabled(bool enabled) {
    g_override.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace transmute::cli
