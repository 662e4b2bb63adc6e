/// @file src/surrogate/coordinator.cpp
/// @brief Fixed worker pool over a pre-loaded job channel.

#include "cmimap/coordinator.hpp"
#include "cmimap/errors.hpp"

#include <fmt/format.h>

#include <exception>
#include <optional>
#include <stop_token>
#include <thread>

namespace cmimap::surrogate {

// ─── make_surrogate_job ───────────────────────────────────────────────────────

JobFn make_surrogate_job(const SurrogateContext& ctx) {
    return [ctx](std::uint64_t index) -> results::MeasurementBundle {
        spectral::Rng rng(spectral::job_seed(ctx.base_seed, index));

        TimeSeries realization;
        realization.values     = ctx.surrogate_template.realize(rng);
        realization.timestamps = ctx.timestamps;

        if (!spectral::reimpose_seasonality(realization, ctx.seasonality)) {
            throw PreconditionError(fmt::format(
                "surrogate {}: cannot re-impose seasonality ({} samples, {} timestamps)",
                index, realization.values.size(), realization.timestamps.size()));
        }
        spectral::recenter(realization.values);

        const grid::InformationGridEngine engine(ctx.grid);
        return engine.compute(realization.values, ctx.scales);
    };
}

// ─── SurrogateCoordinator ─────────────────────────────────────────────────────

SurrogateCoordinator::SurrogateCoordinator(CoordinatorConfig config) : config_(config) {
    if (config_.workers == 0) {
        throw PreconditionError("surrogate coordinator needs at least one worker");
    }
}

std::vector<results::MeasurementBundle>
SurrogateCoordinator::run(const JobFn& job, std::size_t job_count,
                          const ProgressFn& on_progress) const {
    BlockingQueue<WorkItem>   jobs;
    BlockingQueue<WorkResult> results_queue;

    for (std::size_t i = 0; i < job_count; ++i) {
        jobs.push(SurrogateJob{static_cast<std::uint64_t>(i)});
    }
    for (std::size_t w = 0; w < config_.workers; ++w) {
        jobs.push(Shutdown{});
    }

    // Once cancelled, workers skip the remaining jobs and run only to their
    // Shutdown. A job already running is finished.
    std::stop_source cancel;

    auto worker = [&jobs, &results_queue, &job, token = cancel.get_token()] {
        while (true) {
            WorkItem item = jobs.pop();
            if (std::holds_alternative<Shutdown>(item)) {
                return;
            }
            if (token.stop_requested()) {
                continue;
            }
            const std::uint64_t index = std::get<SurrogateJob>(item).index;
            try {
                results_queue.push(job(index));
            } catch (const std::exception& e) {
                results_queue.push(WorkerFailure{index, e.what()});
            }
        }
    };

    // Destroyed in reverse order: cancel first, then join every worker. This
    // holds on every exit path, including exceptions from on_progress.
    std::vector<std::jthread> pool;
    struct CancelOnExit {
        std::stop_source& source;
        ~CancelOnExit() { source.request_stop(); }
    } cancel_on_exit{cancel};

    pool.reserve(config_.workers);
    for (std::size_t w = 0; w < config_.workers; ++w) {
        pool.emplace_back(worker);
    }

    std::vector<results::MeasurementBundle> out;
    out.reserve(job_count);
    std::optional<WorkerFailure> first_failure;
    std::size_t received = 0;

    while (received < job_count) {
        std::optional<WorkResult> result;
        if (config_.result_timeout.count() > 0) {
            result = results_queue.pop_for(config_.result_timeout);
            if (!result) {
                throw CoordinationError(fmt::format(
                    "surrogate results timed out after {}s: {} of {} arrived",
                    config_.result_timeout.count(), received, job_count));
            }
        } else {
            result = results_queue.pop();
        }
        ++received;

        if (auto* bundle = std::get_if<results::MeasurementBundle>(&*result)) {
            out.push_back(std::move(*bundle));
        } else if (!first_failure) {
            first_failure = std::get<WorkerFailure>(std::move(*result));
        }
        if (on_progress) {
            on_progress(received, job_count);
        }
    }

    if (first_failure) {
        throw CoordinationError(fmt::format("surrogate job {} failed: {}",
                                            first_failure->job_index, first_failure->message));
    }
    return out;
}

} // namespace cmimap::surrogate
