#include "ProcessComparisonRunner.h"
#include "ReportSchema.h"

#include <QProcess>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

namespace {
constexpr int kStartTimeoutMs = 30'000;
constexpr int kReapTimeoutMs = 10'000; // after kill()

std::string drainOutput(QProcess& proc)
{
    // decode lossily; compare harnesses occasionally print raw bytes
    auto out = QString::fromUtf8(proc.readAllStandardOutput()).toStdString();
    auto err = QString::fromUtf8(proc.readAllStandardError()).toStdString();
    return out + "\n" + err;
}

// the compare command runs in its own process group; cargo leaves the test
// binary behind if only the direct child is killed
void killProcessGroup(QProcess& proc)
{
    auto const pid = static_cast<pid_t>(proc.processId());
    if (pid > 0 && ::kill(-pid, SIGKILL) != 0)
        spdlog::debug("[exec] kill of process group {} failed: {}", pid, std::strerror(errno));
    proc.kill();
}
}

ProcessComparisonRunner::ProcessComparisonRunner(CommandSpec spec)
    : m_spec(std::move(spec))
{
}

ComparisonResult
ProcessComparisonRunner::run(std::string const& sampleLocator, int timeoutSec)
{
    timeoutSec = std::max(1, timeoutSec);

    QProcess proc;
    auto env = QProcessEnvironment::systemEnvironment();
    if (!m_spec.inputEnvVar.empty())
        env.insert(QString::fromStdString(m_spec.inputEnvVar), QString::fromStdString(sampleLocator));
    proc.setProcessEnvironment(env);

    if (!m_spec.workingDirectory.empty())
        proc.setWorkingDirectory(QString::fromStdString(m_spec.workingDirectory));

    QStringList args;
    for (auto const& a : m_spec.arguments)
        args << QString::fromStdString(a);

    proc.setProgram(QString::fromStdString(m_spec.program));
    proc.setArguments(args);
    proc.setProcessChannelMode(QProcess::SeparateChannels);
    proc.setChildProcessModifier([] { ::setpgid(0, 0); });

    spdlog::debug("[exec] {} {} ({}={})", m_spec.program, fmt::join(m_spec.arguments, " "),
        m_spec.inputEnvVar, sampleLocator);

    proc.start();
    if (!proc.waitForStarted(kStartTimeoutMs)) {
        auto msg = proc.errorString().toStdString();
        spdlog::warn("[exec] cannot start '{}': {}", m_spec.program, msg);
        return { kSpawnFailedExit, fmt::format("{}: {}", schema::kSpawnFailedMarker, msg), false };
    }

    int const timeoutMs = timeoutSec > INT_MAX / 1000 ? INT_MAX : timeoutSec * 1000;
    if (!proc.waitForFinished(timeoutMs) && proc.state() != QProcess::NotRunning) {
        killProcessGroup(proc);
        if (!proc.waitForFinished(kReapTimeoutMs))
            spdlog::warn("[exec] '{}' did not exit after kill", m_spec.program);

        auto output = drainOutput(proc);
        output += fmt::format("\n{}: {}s", schema::kTimeoutMarker, timeoutSec);
        spdlog::debug("[exec] timed out after {}s: {}", timeoutSec, sampleLocator);
        return { kTimeoutExit, std::move(output), true };
    }

    auto output = drainOutput(proc);
    spdlog::debug("[exec] finished ({} bytes captured): {}", output.size(), sampleLocator);

    if (proc.exitStatus() == QProcess::CrashExit) {
        output += fmt::format("\n{}", schema::kCrashMarker);
        return { kCrashExit, std::move(output), false };
    }
    return { proc.exitCode(), std::move(output), false };
}
