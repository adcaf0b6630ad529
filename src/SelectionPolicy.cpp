#include "SelectionPolicy.h"
#include "ReportSchema.h"

std::string_view toString(RunMode mode)
{
    switch (mode) {
    case RunMode::Resume:
        return "resume";
    case RunMode::RetestAll:
        return "retest-all";
    case RunMode::RetestFailed:
        return "retest-failed";
    case RunMode::RetestImprecise:
        return "retest-imprecise";
    }
    return "unknown";
}

bool isPending(ReportRow const& row, int index,
    SelectionOptions const& opts, ExemptionRules const& rules)
{
    using enum schema::RowStatus;

    // the allow-list beats everything, include-skipped included
    if (!opts.indices.empty() && !opts.indices.contains(index))
        return false;

    if (!opts.includeSkipped) {
        if (rules.isHardSkipped(index, row.url()))
            return false;
        if (row.status() == Skipped)
            return false;
    }

    auto const status = row.status();
    switch (opts.mode) {
    case RunMode::RetestAll:
        return true;
    case RunMode::RetestFailed:
        return status == Failure;
    case RunMode::RetestImprecise:
        if (status == Success)
            return !isFullPrecision(row.precision(), opts.fullPrecision, opts.precisionEpsilon);
        return true;
    case RunMode::Resume:
        break;
    }
    return status == Pending;
}

std::vector<int> pendingIndices(std::vector<ReportRow> const& rows,
    SelectionOptions const& opts, ExemptionRules const& rules)
{
    std::vector<int> out;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        int const idx = static_cast<int>(i + 1);
        if (isPending(rows[i], idx, opts, rules))
            out.push_back(idx);
    }
    return out;
}
