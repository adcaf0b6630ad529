// ComparisonRunnerFactory.cpp
#include "ComparisonRunnerFactory.h"
#include "ProcessComparisonRunner.h"

std::unique_ptr<IComparisonRunner>
makeComparisonRunner(CoverageProfile const& profile)
{
    CommandSpec spec;
    spec.program = profile.program;
    spec.arguments = profile.arguments;
    spec.inputEnvVar = profile.inputEnvVar;
    spec.workingDirectory = profile.workingDirectory;
    return std::make_unique<ProcessComparisonRunner>(std::move(spec));
}
