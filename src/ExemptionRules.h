#pragma once

#include "ReportRow.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class ExemptionKind { HardSkip,
    Tolerance };

// A sample is identified by its 1-based row position or by the basename of
// its URL; a rule may name either or both.
struct ExemptionRule {
    ExemptionKind kind = ExemptionKind::HardSkip;
    std::optional<int> index;
    std::string basename;
    std::string reason;
};

// Maintainer-curated overrides. Built once at startup, read-only afterwards.
class ExemptionRules {
public:
    ExemptionRules() = default;
    explicit ExemptionRules(std::vector<ExemptionRule> rules);

    std::optional<std::string> hardSkipReason(int index, std::string_view url) const;
    std::optional<std::string> toleranceReason(std::string_view url) const;

    bool isHardSkipped(int index, std::string_view url) const { return hardSkipReason(index, url).has_value(); }

    std::vector<ExemptionRule> const& rules() const { return m_rules; }

private:
    std::vector<ExemptionRule> m_rules;
};

// "https://host/a/b/clip.aac?x=1" -> "clip.aac"
std::string_view sampleBasename(std::string_view url);

// Forces every hard-skipped row to the skipped state. Idempotent; returns
// true when at least one row changed and the report needs persisting.
bool applyHardSkips(std::vector<ReportRow>& rows, ExemptionRules const& rules);

// Reporting tolerance for a successful row below full precision: the shown
// precision becomes full, the measured value moves into the remark. max_err
// and psnr are left untouched. Returns true when the row was rewritten.
bool applyTolerance(ReportRow& row, ExemptionRules const& rules,
    double fullPrecision, double epsilon);

bool isFullPrecision(std::string const& precision, double fullPrecision, double epsilon);
