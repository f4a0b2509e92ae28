#pragma once

#include <chrono>
#include <iostream>
#include <ostream>
#include <string>

#include "transmute/engine.hpp"

namespace transmute::cli {

// Console progress bar fed from the engine's progress channel.
class ProgressReporter {
public:
    explicit ProgressReporter(std::ostream& out = std::cerr);

    void Update(const ProgressEvent& event);
    void Finish();

    static std::string RenderBar(double fraction, int width = 30);

private:
    std::ostream& out_;
    bool use_ansi_ = false;
    bool printed_ = false;
    std::chrono::steady_clock::time_point last_tick_{};
    double last_fraction_ = -1.0;
};

}  // namespace transmute::cli
