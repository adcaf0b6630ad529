#pragma once
#include <memory>
#include "IComparisonRunner.h"
#include "CoverageProfile.h"

std::unique_ptr<IComparisonRunner>
makeComparisonRunner(CoverageProfile const& profile);
