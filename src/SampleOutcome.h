#pragma once

#include "IComparisonRunner.h"
#include "MetricParser.h"
#include "ReportRow.h"

#include <optional>
#include <span>
#include <string>

// Result of one comparison attempt: metrics, or a reason why there are none.
struct SampleOutcome {
    std::optional<Metrics> metrics;
    std::string failureReason;
    int exitStatus = 0;

    bool succeeded() const { return metrics.has_value(); }
};

SampleOutcome evaluateComparison(ComparisonResult const& result,
    std::span<std::string const> failureKeywords);

// Folds the outcome into a copy of the row. A non-zero exit with metrics is
// still a success, flagged in the remark as a missed strict threshold.
ReportRow applyOutcome(ReportRow row, SampleOutcome const& outcome);
