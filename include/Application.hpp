#pragma once
#include "CommandLine.hpp"

namespace drivesage {

// Runs one parsed command end to end and returns the process exit code.
// With --json, stdout carries only the response document and log lines go
// to std::clog.
int runCommand(const CliOptions &options);

} // namespace drivesage
