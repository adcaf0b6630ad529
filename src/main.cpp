#include "ComparisonRunnerFactory.h"
#include "ConfigManager.h"
#include "CoverageScheduler.h"
#include "ReportStore.h"
#include "SelectionPolicy.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    CoverageProfile profile;
    SelectionOptions selection;
    SchedulerOptions scheduler;
};

int usageError(QCommandLineParser const& parser, std::string const& msg)
{
    std::fprintf(stderr, "%s\n\n%s", msg.c_str(), parser.helpText().toStdString().c_str());
    return kExitUsage;
}

// "3", "3,7,12" and repeated --index all end up in one set
std::optional<std::set<int>> parseIndices(QStringList const& values)
{
    std::set<int> out;
    for (auto const& v : values) {
        for (auto const& part : v.split(',', Qt::SkipEmptyParts)) {
            bool ok = false;
            int const n = part.trimmed().toInt(&ok);
            if (!ok || n < 1)
                return std::nullopt;
            out.insert(n);
        }
    }
    return out;
}

std::size_t defaultJobs()
{
    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("codec_coverage");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Runs the per-sample decoder comparison for every pending row of a coverage report "
        "and records the results in place.");
    parser.addHelpOption();

    // -- Options --
    QCommandLineOption profileOpt("profile", "Built-in profile: aac, vorbis or mp3.", "name", "aac");
    QCommandLineOption configOpt("config", "Load the profile from a JSON file.", "file");
    QCommandLineOption reportOpt("report", "Report file, overrides the profile path.", "path");
    QCommandLineOption retestAllOpt("retest-all", "Re-run every row.");
    QCommandLineOption retestFailedOpt("retest-failed", "Re-run failed rows only.");
    QCommandLineOption retestImpreciseOpt("retest-imprecise",
        "Re-run rows that are not at full precision.");
    QCommandLineOption indexOpt("index", "Only consider these 1-based rows (repeatable, or comma list).", "N");
    QCommandLineOption jobsOpt(QStringList { "j", "jobs" }, "Concurrent comparisons.", "N");
    QCommandLineOption timeoutOpt("timeout", "Per-sample timeout in seconds.", "sec");
    QCommandLineOption includeSkippedOpt("include-skipped", "Also run skipped and hard-skipped rows.");
    QCommandLineOption verboseOpt("verbose", "Debug logging.");
    QCommandLineOption dumpOpt("dump-profile", "Write the resolved profile as JSON and exit.", "file");

    parser.addOptions({ profileOpt, configOpt, reportOpt, retestAllOpt, retestFailedOpt,
        retestImpreciseOpt, indexOpt, jobsOpt, timeoutOpt, includeSkippedOpt, verboseOpt, dumpOpt });

    if (!parser.parse(QCoreApplication::arguments()))
        return usageError(parser, parser.errorText().toStdString());
    if (parser.isSet("help")) {
        std::fputs(parser.helpText().toStdString().c_str(), stdout);
        return kExitOk;
    }

    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(parser.isSet(verboseOpt) ? spdlog::level::debug : spdlog::level::info);

    CliOptions cli;

    // -- Mode --
    int const modeFlags = int(parser.isSet(retestAllOpt)) + int(parser.isSet(retestFailedOpt))
        + int(parser.isSet(retestImpreciseOpt));
    if (modeFlags > 1)
        return usageError(parser, "--retest-all, --retest-failed and --retest-imprecise are mutually exclusive");
    if (parser.isSet(retestAllOpt))
        cli.selection.mode = RunMode::RetestAll;
    else if (parser.isSet(retestFailedOpt))
        cli.selection.mode = RunMode::RetestFailed;
    else if (parser.isSet(retestImpreciseOpt))
        cli.selection.mode = RunMode::RetestImprecise;

    auto indices = parseIndices(parser.values(indexOpt));
    if (!indices)
        return usageError(parser, "--index expects positive row numbers");
    cli.selection.indices = std::move(*indices);
    cli.selection.includeSkipped = parser.isSet(includeSkippedOpt);

    cli.scheduler.jobs = defaultJobs();
    if (parser.isSet(jobsOpt)) {
        bool ok = false;
        int const j = parser.value(jobsOpt).toInt(&ok);
        if (!ok)
            return usageError(parser, "--jobs expects a number");
        cli.scheduler.jobs = static_cast<std::size_t>(std::max(1, j));
    }

    std::optional<int> timeoutOverride;
    if (parser.isSet(timeoutOpt)) {
        bool ok = false;
        int const t = parser.value(timeoutOpt).toInt(&ok);
        if (!ok || t < 1)
            return usageError(parser, "--timeout expects a positive number of seconds");
        timeoutOverride = t;
    }

    // -- Profile --
    try {
        if (parser.isSet(configOpt)) {
            cli.profile = cfg::loadProfile(parser.value(configOpt).toStdString());
        } else {
            auto const name = parser.value(profileOpt).toStdString();
            auto builtin = cfg::builtinProfile(name);
            if (!builtin)
                return usageError(parser, "unknown profile '" + name + "'");
            cli.profile = std::move(*builtin);
        }
        if (parser.isSet(reportOpt))
            cli.profile.reportPath = parser.value(reportOpt).toStdString();
        if (timeoutOverride)
            cli.profile.timeoutSec = *timeoutOverride;

        if (parser.isSet(dumpOpt)) {
            cfg::saveProfile(parser.value(dumpOpt).toStdString(), cli.profile);
            spdlog::info("[cfg] profile '{}' written to {}", cli.profile.name, parser.value(dumpOpt).toStdString());
            return kExitOk;
        }
    } catch (ConfigError const& e) {
        spdlog::error("[cfg] {}", e.what());
        return kExitFailure;
    }

    cli.selection.fullPrecision = cli.profile.fullPrecision;
    cli.selection.precisionEpsilon = cli.profile.precisionEpsilon;
    cli.scheduler.timeoutSec = cli.profile.timeoutSec;
    cli.scheduler.failureKeywords = cli.profile.failureKeywords;
    cli.scheduler.fullPrecision = cli.profile.fullPrecision;
    cli.scheduler.precisionEpsilon = cli.profile.precisionEpsilon;

    spdlog::info("[cfg] profile '{}', report {}, mode {}", cli.profile.name, cli.profile.reportPath,
        toString(cli.selection.mode));

    // -- Run --
    try {
        ReportStore store(cli.profile.reportPath);
        auto report = store.load();
        auto const rules = toExemptionRules(cli.profile);
        auto runner = makeComparisonRunner(cli.profile);

        CoverageScheduler scheduler(store, std::move(report), *runner, rules, cli.scheduler);
        auto const summary = scheduler.run(cli.selection);
        if (summary.pending == 0 && summary.skipsPersisted)
            spdlog::info("[run] hard skips written to {}", cli.profile.reportPath);
    } catch (ReportFormatError const& e) {
        spdlog::error("[report] {}", e.what());
        return kExitFailure;
    } catch (ReportIoError const& e) {
        spdlog::error("[report] {}", e.what());
        return kExitFailure;
    } catch (std::exception const& e) {
        spdlog::error("[run] {}", e.what());
        return kExitFailure;
    }

    return kExitOk;
}
