#pragma once

#include <string>

namespace transmute::log {

// Debug and Info print only when verbose; verbose defaults to TRANSMUTE_VERBOSE.
bool Verbose();
void SetVerbose(bool enabled);
void SetQuiet(bool quiet);

void Debug(const std::string& message);
void Info(const std::string& message);
void Warn(const std::string& message);
void Error(const std::string& message);

}  // namespace transmute::log
