#pragma once

#include "ExemptionRules.h"
#include "ReportRow.h"

#include <set>
#include <string_view>
#include <vector>

enum class RunMode { Resume,
    RetestAll,
    RetestFailed,
    RetestImprecise };

std::string_view toString(RunMode mode);

struct SelectionOptions {
    RunMode mode = RunMode::Resume;
    std::set<int> indices; // 1-based allow-list, empty = every row
    bool includeSkipped = false;
    double fullPrecision = 100.0;
    double precisionEpsilon = 1e-6;
};

// true when the row at 1-based `index` has to be (re)tested this run
bool isPending(ReportRow const& row, int index,
    SelectionOptions const& opts, ExemptionRules const& rules);

// 1-based indices of pending rows, in report order
std::vector<int> pendingIndices(std::vector<ReportRow> const& rows,
    SelectionOptions const& opts, ExemptionRules const& rules);
