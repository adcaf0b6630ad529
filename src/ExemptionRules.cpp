#include "ExemptionRules.h"
#include "MetricParser.h"
#include "ReportSchema.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>

ExemptionRules::ExemptionRules(std::vector<ExemptionRule> rules)
    : m_rules(std::move(rules))
{
}

std::string_view sampleBasename(std::string_view url)
{
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos)
        url = url.substr(0, cut);
    while (!url.empty() && url.back() == '/')
        url.remove_suffix(1);
    auto slash = url.find_last_of('/');
    return slash == std::string_view::npos ? url : url.substr(slash + 1);
}

namespace {

bool matches(ExemptionRule const& r, int index, std::string_view url)
{
    if (r.index && *r.index == index)
        return true;
    return !r.basename.empty() && r.basename == sampleBasename(url);
}

} // namespace

std::optional<std::string> ExemptionRules::hardSkipReason(int index, std::string_view url) const
{
    for (auto const& r : m_rules) {
        if (r.kind == ExemptionKind::HardSkip && matches(r, index, url))
            return r.reason.empty() ? std::string(schema::kDefaultSkipReason) : escapeCell(r.reason);
    }
    return std::nullopt;
}

std::optional<std::string> ExemptionRules::toleranceReason(std::string_view url) const
{
    auto const base = sampleBasename(url);
    for (auto const& r : m_rules) {
        if (r.kind == ExemptionKind::Tolerance && !r.basename.empty() && r.basename == base)
            return escapeCell(r.reason);
    }
    return std::nullopt;
}

bool isFullPrecision(std::string const& precision, double fullPrecision, double epsilon)
{
    double v = 0.0;
    auto const* first = precision.data();
    auto const* last = first + precision.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc {} || ptr == first)
        return false;
    return v >= fullPrecision - epsilon;
}

bool applyHardSkips(std::vector<ReportRow>& rows, ExemptionRules const& rules)
{
    using enum schema::Column;

    bool changed = false;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        auto& row = rows[i];
        auto const reason = rules.hardSkipReason(static_cast<int>(i + 1), row.url());
        if (!reason)
            continue;
        if (row.status() == schema::RowStatus::Skipped && row.get(Reason) == *reason)
            continue;

        row.setStatus(schema::RowStatus::Skipped);
        row.set(Reason, *reason);
        row.clearMetrics();
        row.set(Remark, std::string(schema::kRemarkSkipped));
        changed = true;
        spdlog::info("[exempt] row {} hard-skipped: {}", i + 1, *reason);
    }
    return changed;
}

bool applyTolerance(ReportRow& row, ExemptionRules const& rules,
    double fullPrecision, double epsilon)
{
    if (row.status() != schema::RowStatus::Success)
        return false;
    auto const reason = rules.toleranceReason(row.url());
    if (!reason)
        return false;

    auto const measured = row.precision();
    if (isFullPrecision(measured, fullPrecision, epsilon))
        return false;

    row.set(schema::Column::Precision, formatPrecision(fullPrecision));
    row.set(schema::Column::Remark, reason->empty()
            ? fmt::format("容差豁免, 实际精度 {}%", measured)
            : fmt::format("{}, 实际精度 {}%", *reason, measured));
    return true;
}
