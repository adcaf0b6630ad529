#include "SampleOutcome.h"
#include "ReportSchema.h"

SampleOutcome evaluateComparison(ComparisonResult const& result,
    std::span<std::string const> failureKeywords)
{
    SampleOutcome o;
    o.exitStatus = result.exitStatus;
    o.metrics = parseMetrics(result.output);
    if (!o.metrics)
        o.failureReason = classifyFailure(result.output, failureKeywords);
    return o;
}

ReportRow applyOutcome(ReportRow row, SampleOutcome const& outcome)
{
    using enum schema::Column;

    if (outcome.metrics) {
        auto const& m = *outcome.metrics;
        row.setStatus(schema::RowStatus::Success);
        row.set(Reason, {});
        row.set(DecoderCount, std::to_string(m.decoderCount));
        row.set(ReferenceCount, std::to_string(m.referenceCount));
        row.set(CountDelta, std::to_string(m.delta));
        row.set(MaxErr, m.maxErr);
        row.set(Psnr, m.psnr);
        row.set(Precision, m.precision);
        row.set(Remark, outcome.exitStatus != 0 ? std::string(schema::kRemarkStrictFailed) : std::string {});
        return row;
    }

    row.setStatus(schema::RowStatus::Failure);
    row.set(Reason, outcome.failureReason);
    row.clearMetrics();
    row.set(Remark, {});
    return row;
}
