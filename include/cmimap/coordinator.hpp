#pragma once

/// @file include/cmimap/coordinator.hpp
/// @brief Surrogate Coordinator: fixed worker pool producing exactly N bundles.
///
/// # Module: SurrogateCoordinator
///
/// ## Protocol
/// The job channel is pre-loaded with N `SurrogateJob{index}` items followed
/// by W `Shutdown` items. W worker threads loop:
///
///     item ← jobs.pop()
///     Shutdown       → exit
///     SurrogateJob j → results.push(job(j.index))
///
/// The coordinator pops exactly N results (arrival order, not job order),
/// reports progress after each, and joins every worker. Work-stealing through
/// the shared channel balances load on its own.
///
/// ## Failure Handling
/// A job that throws is caught inside its worker and delivered as a
/// `WorkerFailure`, so the coordinator never waits on a result that cannot
/// come. After draining and joining, the first failure is rethrown as
/// `CoordinationError`; no partial ensemble is returned. With a non-zero
/// `result_timeout`, a wait that exceeds it also ends in
/// `CoordinationError`.
///
/// Every early exit (timeout, or an exception from `on_progress`) cancels
/// the pool: workers skip the jobs still queued and stop at their Shutdown.
/// Jobs already running are waited for before `run` returns or throws, so
/// a timeout costs at most `result_timeout` plus one job per worker.
///
/// ## Isolation
/// Each job builds its own RNG, realization and engine. What the job shares
/// (template, seasonality, grid) is const.

#include "cmimap/blocking_queue.hpp"
#include "cmimap/config.hpp"
#include "cmimap/grid_engine.hpp"
#include "cmimap/results.hpp"
#include "cmimap/seasonality.hpp"
#include "cmimap/surrogates.hpp"
#include "cmimap/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace cmimap::surrogate {

// ─── Channel Messages ─────────────────────────────────────────────────────────

struct SurrogateJob {
    std::uint64_t index;
};

struct Shutdown {};

using WorkItem = std::variant<SurrogateJob, Shutdown>;

struct WorkerFailure {
    std::uint64_t job_index;
    std::string   message;
};

using WorkResult = std::variant<results::MeasurementBundle, WorkerFailure>;

// ─── Configuration ────────────────────────────────────────────────────────────

struct CoordinatorConfig {
    std::size_t          workers = constants::DEFAULT_WORKERS;
    std::chrono::seconds result_timeout{0};  ///< 0 = wait indefinitely
};

/// Unit of work: job index → bundle. Must be safe to call concurrently.
using JobFn = std::function<results::MeasurementBundle(std::uint64_t)>;

/// Called on the coordinator thread after each result: (done, total).
using ProgressFn = std::function<void(std::size_t, std::size_t)>;

// ─── Surrogate Job Factory ────────────────────────────────────────────────────

/// Read-only inputs of a surrogate job. The job copies this struct, so the
/// struct itself may be a temporary; every object it references must
/// outlive the job.
struct SurrogateContext {
    const spectral::SurrogateTemplate&        surrogate_template;
    const spectral::SeasonalityDecomposition& seasonality;
    const std::vector<Date>&                  timestamps;  ///< template sample dates
    const ScaleGrid&                          scales;
    grid::GridConfig                          grid;
    std::uint64_t                             base_seed;
};

/// Realize → re-impose seasonality → recenter → grid engine, seeded by
/// `job_seed(base_seed, index)`.
[[nodiscard]] JobFn make_surrogate_job(const SurrogateContext& ctx);

// ─── Coordinator ──────────────────────────────────────────────────────────────

class SurrogateCoordinator {
public:
    /// Throws `PreconditionError` if `config.workers` is 0.
    explicit SurrogateCoordinator(CoordinatorConfig config);

    /// Run `job_count` jobs on the pool and return their bundles in arrival
    /// order. `job_count` = 0 returns an empty vector once every worker has
    /// consumed its Shutdown.
    [[nodiscard]] std::vector<results::MeasurementBundle>
    run(const JobFn& job, std::size_t job_count, const ProgressFn& on_progress = {}) const;

    [[nodiscard]] const CoordinatorConfig& config() const noexcept { return config_; }

private:
    CoordinatorConfig config_;
};

} // namespace cmimap::surrogate
