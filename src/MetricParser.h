#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

// Comparison figures reported by the external compare command for one sample.
// max_err / psnr are kept as printed; psnr may be a word such as "inf".
struct Metrics {
    long long decoderCount = 0;
    long long referenceCount = 0;
    long long delta = 0;
    std::string maxErr;
    std::string psnr;
    std::string precision; // two decimals, e.g. "99.87"
    double precisionValue = 0.0;
};

// First line carrying both the sample-count and the precision markers that
// matches the structured pattern wins. Heuristic: the compare command's output
// is free text, not a contract.
std::optional<Metrics> parseMetrics(std::string_view output);

// One-line reason for a run that produced no metrics. Tiers, in order:
//   1. last non-empty line containing one of the keywords
//   2. last three non-empty lines joined with " / "
//   3. "无输出" when there is no output at all
// Table delimiters are escaped so the reason cannot split a report cell.
std::string classifyFailure(std::string_view output,
    std::span<std::string const> keywords);

std::string escapeCell(std::string_view text);

std::string formatPrecision(double value);
