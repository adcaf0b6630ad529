#pragma once

#include <string>

struct ComparisonResult {
    int exitStatus = 0;
    std::string output; // stdout + "\n" + stderr
    bool timedOut = false;
};

class IComparisonRunner {
public:
    virtual ~IComparisonRunner() = 0;

    // Compare one sample against the reference decoder. Never throws for
    // problems of the sample itself; those come back in the result.
    virtual ComparisonResult
    run(
        std::string const& sampleLocator,
        int timeoutSec) = 0;
};

inline IComparisonRunner::~IComparisonRunner() = default;
