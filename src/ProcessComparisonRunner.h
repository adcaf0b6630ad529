#pragma once

#include "IComparisonRunner.h"

#include <string>
#include <vector>

struct CommandSpec {
    std::string program;
    std::vector<std::string> arguments;
    std::string inputEnvVar;      // receives the sample locator
    std::string workingDirectory; // empty = inherit
};

// Runs the external compare command in a child process, one per call.
// Safe to call from several threads at once; each call owns its QProcess.
class ProcessComparisonRunner : public IComparisonRunner {
public:
    static constexpr int kTimeoutExit = 124;
    static constexpr int kSpawnFailedExit = 127;
    static constexpr int kCrashExit = -1;

    explicit ProcessComparisonRunner(CommandSpec spec);

    ComparisonResult
    run(std::string const& sampleLocator, int timeoutSec) override;

private:
    CommandSpec m_spec;
};
