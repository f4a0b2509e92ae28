#include "transmute/progress.hpp"

#include "transmute/cli_colors.hpp"
#include "transmute/env.hpp"

#include <cmath>

namespace transmute::cli {

ProgressReporter::ProgressReporter(std::ostream& out) : out_(out) {
    std::string term = env::Get("TERM");
    use_ansi_ = ColorsEnabled(out_) && !term.empty() && term != "dumb";
    last_tick_ = std::chrono::steady_clock::now();
}

std::string ProgressReporter::RenderBar(double fraction, int width) {
    if (fraction < 0.0) {
        fraction = 0.0;
    } else if (fraction > 1.0) {
        fraction = 1.0;
    }
    int filled = static_cast<int>(std::round(fraction * width));
    if (filled > width) {
        filled = width;
    }
    std::string bar;
    bar.reserve(static_cast<std::size_t>(width + 2));
    bar.push_back('(');
    bar.append(static_cast<std::size_t>(filled), '#');
    bar.append(static_cast<std::size_t>(width - filled), ' ');
    bar.push_back(')');
    return bar;
}

void ProgressReporter::Update(const ProgressEvent& event) {
    if (event.state != JobState::kTransforming || event.chunks_total == 0) {
        return;
    }
    double fraction = static_cast<double>(event.chunks_done) / static_cast<double>(event.chunks_total);
    auto now = std::chrono::steady_clock::now();
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick_);
    if (printed_ && delta.count() < 120 && fraction < 1.0 && std::abs(fraction - last_fraction_) < 0.005) {
        return;
    }
    last_tick_ = now;
    last_fraction_ = fraction;
    int pct = static_cast<int>(std::round(fraction * 100.0));
    std::string line = std::string(OperationName(event.operation)) + " " + RenderBar(fraction) + " " +
                       std::to_string(pct) + "% " + Dim(std::to_string(event.chunks_done) + "/" +
                                                         std::to_string(event.chunks_total) + " chunks");
    if (use_ansi_) {
        out_ << "\r\033[2K" << line << std::flush;
    } else {
        out_ << line << std::endl;
    }
    printed_ = true;
}

void ProgressReporter::Finish() {
    if (printed_) {
        if (use_ansi_) {
            out_ << std::endl;
        }
        printed_ = false;
    }
}

}  // namespace transmute::cli
