#pragma once

#include "BoundedQueue.h"
#include "ExemptionRules.h"
#include "IComparisonRunner.h"
#include "ReportStore.h"
#include "SelectionPolicy.h"

#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

struct SchedulerOptions {
    std::size_t jobs = 1;
    int timeoutSec = 60;
    std::vector<std::string> failureKeywords;
    double fullPrecision = 100.0;
    double precisionEpsilon = 1e-6;
};

struct RunSummary {
    std::size_t total = 0;   // rows in the report
    std::size_t pending = 0; // rows selected this run
    std::size_t recorded = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    bool skipsPersisted = false;
};

// Owns the in-memory report for one run and is its only writer. Comparisons
// run on a fixed pool of workers; every finished sample is folded into its
// row and the whole report is rewritten under one lock before the next
// completion is accepted. No lock is held while a comparison runs.
class CoverageScheduler {
public:
    CoverageScheduler(ReportStore const& store,
        Report report,
        IComparisonRunner& runner,
        ExemptionRules const& rules,
        SchedulerOptions opts);

    CoverageScheduler(CoverageScheduler const&) = delete;
    CoverageScheduler& operator=(CoverageScheduler const&) = delete;

    // Returns once every selected row is recorded. Per-sample problems end up
    // in the rows; a failed report write stops the pool and is rethrown.
    RunSummary run(SelectionOptions const& selection);

    Report const& report() const { return m_report; }

private:
    void workerLoop(std::stop_token tk, BoundedQueue<int>& queue);
    void processRow(int index);
    void recordError(std::exception_ptr err);

    ReportStore const& m_store;
    Report m_report;
    IComparisonRunner& m_runner;
    ExemptionRules const& m_rules;
    SchedulerOptions m_opts;

    std::mutex m_reportMutex; // guards m_report.rows + m_summary + the file
    RunSummary m_summary;

    std::stop_source m_stop;
    std::mutex m_errorMutex;
    std::exception_ptr m_firstError;
    std::atomic_bool m_fatal { false };
};
