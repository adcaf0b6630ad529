#pragma once

#include "ExemptionRules.h"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct HardSkipEntry {
    std::optional<int> index;
    std::string basename;
    std::string reason;
};

struct ToleranceEntry {
    std::string basename;
    std::string reason;
};

/* json helpers */
inline void to_json(nlohmann::json& j, HardSkipEntry const& e)
{
    j = { { "basename", e.basename }, { "reason", e.reason } };
    j["index"] = e.index.has_value() ? nlohmann::json(*e.index) : nullptr;
}
inline void from_json(nlohmann::json const& j, HardSkipEntry& e)
{
    if (j.contains("index") && !j.at("index").is_null())
        e.index = j.at("index").get<int>();
    else
        e.index = std::nullopt;
    e.basename = j.value("basename", std::string {});
    e.reason = j.value("reason", std::string {});
}

inline void to_json(nlohmann::json& j, ToleranceEntry const& e)
{
    j = { { "basename", e.basename }, { "reason", e.reason } };
}
inline void from_json(nlohmann::json const& j, ToleranceEntry& e)
{
    j.at("basename").get_to(e.basename);
    e.reason = j.value("reason", std::string {});
}

// Everything that differs between codec families: where the report lives,
// which command compares one sample, and the curated exemptions.
struct CoverageProfile {
    std::string name = "aac";
    std::string reportPath;
    std::string inputEnvVar;
    std::string program = "cargo";
    std::vector<std::string> arguments;
    std::string workingDirectory; // empty = inherit
    int timeoutSec = 60;

    std::vector<std::string> failureKeywords;

    double fullPrecision = 100.0;
    double precisionEpsilon = 1e-6;

    std::vector<HardSkipEntry> hardSkips;
    std::vector<ToleranceEntry> tolerances;
};

inline void to_json(nlohmann::json& j, CoverageProfile const& p)
{
    j = nlohmann::json {
        { "name", p.name },
        { "reportPath", p.reportPath },
        { "inputEnvVar", p.inputEnvVar },
        { "program", p.program },
        { "arguments", p.arguments },
        { "workingDirectory", p.workingDirectory },
        { "timeoutSec", p.timeoutSec },
        { "failureKeywords", p.failureKeywords },
        { "fullPrecision", p.fullPrecision },
        { "precisionEpsilon", p.precisionEpsilon },
        { "hardSkips", p.hardSkips },
        { "tolerances", p.tolerances }
    };
}

inline void from_json(nlohmann::json const& j, CoverageProfile& p)
{
    j.at("name").get_to(p.name);
    j.at("reportPath").get_to(p.reportPath);
    j.at("inputEnvVar").get_to(p.inputEnvVar);
    j.at("program").get_to(p.program);

    if (j.contains("arguments"))
        j.at("arguments").get_to(p.arguments);
    p.workingDirectory = j.value("workingDirectory", std::string {});
    p.timeoutSec = std::max(1, j.value("timeoutSec", 60));

    if (j.contains("failureKeywords"))
        j.at("failureKeywords").get_to(p.failureKeywords);

    p.fullPrecision = std::clamp(j.value("fullPrecision", 100.0), 0.0, 100.0);
    p.precisionEpsilon = std::clamp(j.value("precisionEpsilon", 1e-6), 0.0, 1.0);

    if (j.contains("hardSkips"))
        j.at("hardSkips").get_to(p.hardSkips);
    if (j.contains("tolerances"))
        j.at("tolerances").get_to(p.tolerances);
}

inline ExemptionRules toExemptionRules(CoverageProfile const& p)
{
    std::vector<ExemptionRule> rules;
    rules.reserve(p.hardSkips.size() + p.tolerances.size());
    for (auto const& s : p.hardSkips)
        rules.push_back({ ExemptionKind::HardSkip, s.index, s.basename, s.reason });
    for (auto const& t : p.tolerances)
        rules.push_back({ ExemptionKind::Tolerance, std::nullopt, t.basename, t.reason });
    return ExemptionRules(std::move(rules));
}
