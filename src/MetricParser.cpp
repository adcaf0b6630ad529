#include "MetricParser.h"
#include "ReportSchema.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>
#include <stdexcept>
#include <vector>

namespace {

constexpr std::string_view kCountMarker = "对比样本=";
constexpr std::string_view kPrecisionMarker = "精度=";
constexpr std::string_view kMaxErrMarker = "max_err=";

// std::regex recurses per input character; every match runs on a bounded
// window so a pathological line cannot exhaust the stack.
constexpr std::size_t kMatchWindow = 512;

constexpr std::string_view kNumber = R"([-+]?[0-9]*\.?[0-9]+(?:[eE][-+]?[0-9]+)?)";

using LineMatch = std::match_results<std::string_view::const_iterator>;

std::regex const& countsRegex()
{
    static std::regex const rx(R"(对比样本=(\d+),\s*Tao=(\d+),\s*FFmpeg=(\d+),)",
        std::regex::ECMAScript | std::regex::optimize);
    return rx;
}

std::regex const& figuresRegex()
{
    static std::regex const rx(
        "max_err=(" + std::string(kNumber) + R"(),\s*)"
            + "psnr=([A-Za-z]+|" + std::string(kNumber) + R"()dB,\s*)"
            + R"(精度=([-+]?[0-9]*\.?[0-9]+)%)",
        std::regex::ECMAScript | std::regex::optimize);
    return rx;
}

// anchored at `from`, never looking past kMatchWindow bytes
bool matchAt(std::string_view line, std::size_t from, std::regex const& rx, LineMatch& m)
{
    auto const to = std::min(line.size(), from + kMatchWindow);
    return std::regex_search(line.begin() + from, line.begin() + to, m, rx,
        std::regex_constants::match_continuous);
}

std::optional<Metrics> parseLine(std::string_view line)
{
    for (auto head = line.find(kCountMarker); head != std::string_view::npos;
         head = line.find(kCountMarker, head + 1)) {
        LineMatch counts;
        if (!matchAt(line, head, countsRegex(), counts))
            continue;

        // free text may sit between the counts and the figures
        auto const tail = line.find(kMaxErrMarker, head + static_cast<std::size_t>(counts.length(0)));
        if (tail == std::string_view::npos)
            return std::nullopt;

        LineMatch figures;
        if (!matchAt(line, tail, figuresRegex(), figures))
            continue;

        Metrics r;
        r.decoderCount = std::stoll(counts[2].str());
        r.referenceCount = std::stoll(counts[3].str());
        r.delta = r.decoderCount - r.referenceCount;
        r.maxErr = figures[1].str();
        r.psnr = figures[2].str();
        r.precisionValue = std::stod(figures[3].str());
        r.precision = formatPrecision(r.precisionValue);
        return r;
    }
    return std::nullopt;
}

std::vector<std::string_view> nonEmptyLines(std::string_view text)
{
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto nl = text.find('\n', start);
        auto line = text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);

        auto const ws = " \t\r\v\f";
        auto b = line.find_first_not_of(ws);
        if (b != std::string_view::npos) {
            auto e = line.find_last_not_of(ws);
            out.push_back(line.substr(b, e - b + 1));
        }
        if (nl == std::string_view::npos)
            break;
        start = nl + 1;
    }
    return out;
}

} // namespace

std::string escapeCell(std::string_view text)
{
    std::string out(text);
    std::replace(out.begin(), out.end(), '|', '/');
    return out;
}

std::string formatPrecision(double value)
{
    return fmt::format("{:.2f}", value);
}

std::optional<Metrics> parseMetrics(std::string_view output)
{
    std::size_t start = 0;
    while (start <= output.size()) {
        auto nl = output.find('\n', start);
        auto line = output.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);

        if (line.find(kCountMarker) != std::string_view::npos
            && line.find(kPrecisionMarker) != std::string_view::npos) {
            try {
                if (auto m = parseLine(line))
                    return m;
            } catch (std::exception const& e) {
                spdlog::debug("[parse] metrics line rejected ({}): {}", e.what(), line.substr(0, kMatchWindow));
            }
        }

        if (nl == std::string_view::npos)
            break;
        start = nl + 1;
    }
    return std::nullopt;
}

std::string classifyFailure(std::string_view output,
    std::span<std::string const> keywords)
{
    auto lines = nonEmptyLines(output);
    if (lines.empty())
        return std::string(schema::kNoOutput);

    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        bool const hit = std::any_of(keywords.begin(), keywords.end(), [&](std::string const& k) {
            return !k.empty() && it->find(k) != std::string_view::npos;
        });
        if (hit)
            return escapeCell(*it);
    }

    auto const tail = std::min<std::size_t>(lines.size(), 3);
    std::string reason;
    for (auto i = lines.size() - tail; i < lines.size(); ++i) {
        if (!reason.empty())
            reason += " / ";
        reason += escapeCell(lines[i]);
    }
    return reason;
}
