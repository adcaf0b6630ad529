#include "CoverageScheduler.h"
#include "ReportSchema.h"
#include "SampleOutcome.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace {
constexpr int kPoisonPill = 0; // row indices are 1-based
}

CoverageScheduler::CoverageScheduler(ReportStore const& store,
    Report report,
    IComparisonRunner& runner,
    ExemptionRules const& rules,
    SchedulerOptions opts)
    : m_store(store)
    , m_report(std::move(report))
    , m_runner(runner)
    , m_rules(rules)
    , m_opts(std::move(opts))
{
    m_opts.jobs = std::max<std::size_t>(1, m_opts.jobs);
    m_opts.timeoutSec = std::max(1, m_opts.timeoutSec);
}

RunSummary CoverageScheduler::run(SelectionOptions const& selection)
{
    m_summary = {};
    m_summary.total = m_report.rows.size();

    // --- Hard skips first; persisted even if nothing runs afterwards ---
    if (!selection.includeSkipped && applyHardSkips(m_report.rows, m_rules)) {
        std::lock_guard lk(m_reportMutex);
        m_store.write(m_report);
        m_summary.skipsPersisted = true;
    }

    auto const pending = pendingIndices(m_report.rows, selection, m_rules);
    m_summary.pending = pending.size();
    if (pending.empty()) {
        spdlog::info("[run] nothing to do ({} rows, mode {})", m_summary.total, toString(selection.mode));
        return m_summary;
    }

    std::size_t const poolSize = std::min(m_opts.jobs, pending.size());
    spdlog::info("[run] {} rows pending, jobs: {}, timeout per sample: {}s",
        pending.size(), poolSize, m_opts.timeoutSec);

    // --- Fan out over the worker pool ---
    {
        BoundedQueue<int> queue { poolSize * 2 };
        std::vector<std::jthread> workers;
        workers.reserve(poolSize);
        for (std::size_t i = 0; i < poolSize; ++i) {
            workers.emplace_back([this, &queue, tk = m_stop.get_token()] {
                workerLoop(tk, queue);
            });
        }

        auto const tk = m_stop.get_token();
        for (int idx : pending) {
            int item = idx;
            if (!queue.push(std::move(item), tk))
                break; // a worker hit a fatal error
        }
        for (std::size_t i = 0; i < poolSize; ++i) {
            int pill = kPoisonPill;
            if (!queue.push(std::move(pill), tk))
                break;
        }
        // jthreads join here
    }

    if (m_firstError)
        std::rethrow_exception(m_firstError);

    spdlog::info("[run] done: {} recorded ({} success, {} failure)",
        m_summary.recorded, m_summary.succeeded, m_summary.failed);
    return m_summary;
}

void CoverageScheduler::workerLoop(std::stop_token tk, BoundedQueue<int>& queue)
{
    while (!tk.stop_requested()) {
        int index = kPoisonPill;
        if (!queue.pop(index, tk))
            break; // cancelled
        if (index == kPoisonPill)
            break;

        try {
            processRow(index);
        } catch (std::exception const& e) {
            spdlog::error("[run] row {} aborted the run: {}", index, e.what());
            recordError(std::current_exception());
        } catch (...) {
            spdlog::error("[run] row {} aborted the run: unknown error", index);
            recordError(std::current_exception());
        }
    }
}

void CoverageScheduler::recordError(std::exception_ptr err)
{
    {
        std::lock_guard lk(m_errorMutex);
        if (!m_firstError)
            m_firstError = std::move(err);
    }
    m_fatal.store(true, std::memory_order_relaxed);
    m_stop.request_stop();
}

void CoverageScheduler::processRow(int index)
{
    auto const pos = static_cast<std::size_t>(index - 1);
    auto const total = m_report.rows.size();

    // only this task ever writes rows[pos], so reading it unlocked is fine
    ReportRow row = m_report.rows[pos];
    auto const url = row.url();

    spdlog::info("[run] starting {}/{}: {}", index, total, url);

    auto const result = m_runner.run(url, m_opts.timeoutSec);
    auto const outcome = evaluateComparison(result, m_opts.failureKeywords);

    auto updated = applyOutcome(std::move(row), outcome);
    if (applyTolerance(updated, m_rules, m_opts.fullPrecision, m_opts.precisionEpsilon))
        spdlog::info("[run] row {} reported under tolerance: {}", index, updated.get(schema::Column::Remark));

    std::lock_guard lk(m_reportMutex);
    if (m_fatal.load(std::memory_order_relaxed))
        return; // the report can no longer be written, keep the file as is

    m_report.rows[pos] = std::move(updated);
    m_store.write(m_report);

    ++m_summary.recorded;
    if (outcome.succeeded())
        ++m_summary.succeeded;
    else
        ++m_summary.failed;

    spdlog::info("[run] recorded {}/{}: {}", index, total, schema::toString(m_report.rows[pos].status()));
}
