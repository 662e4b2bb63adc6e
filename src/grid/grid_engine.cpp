/// @file src/grid/grid_engine.cpp
/// @brief InformationGridEngine: S×S evaluation of the four coupling measures.

#include "cmimap/grid_engine.hpp"
#include "cmimap/errors.hpp"
#include "cmimap/wavelet.hpp"

#include <fmt/format.h>

#include <vector>

namespace cmimap::grid {

namespace {

[[noreturn]] void fail(results::Measure m, int scale_i, int scale_j, std::string_view why) {
    throw PreconditionError(fmt::format("{} at scales ({}, {}): {}",
                                        results::measure_name(m), scale_i, scale_j, why));
}

} // namespace

InformationGridEngine::InformationGridEngine(GridConfig config) : config_(config) {}

causality::CausalityParams InformationGridEngine::phase_phase_params() const noexcept {
    causality::CausalityParams p;
    p.max_lag          = config_.max_lag;
    p.binned           = information::BinnedEstimator::EQQ2;
    p.condition_dim    = 1;
    p.smoothing        = 0;
    p.phase_difference = true;
    p.bins             = config_.bins;
    p.k                = config_.k;
    p.search           = config_.search;
    return p;
}

causality::CausalityParams InformationGridEngine::phase_amp_params(int scale_i) const noexcept {
    causality::CausalityParams p = phase_phase_params();
    p.binned           = information::BinnedEstimator::GCM;
    p.condition_dim    = constants::PHASE_AMP_CONDITION_DIM;
    p.smoothing        = scale_i / constants::PHASE_AMP_SMOOTHING_DIVISOR;  // truncating
    p.phase_difference = false;
    return p;
}

results::MeasurementBundle
InformationGridEngine::compute(std::span<const double> field, const ScaleGrid& scales) const {
    using results::Measure;

    if (config_.max_lag < 2) {
        throw PreconditionError(fmt::format(
            "max_lag must be >= 2 for a non-empty lag range (got {})", config_.max_lag));
    }

    // One decomposition per scale, reused across the grid.
    std::vector<PhaseAmplitude> decomposed;
    std::vector<std::vector<double>> amp_squared;
    decomposed.reserve(scales.size());
    amp_squared.reserve(scales.size());
    for (int s : scales) {
        auto pa = spectral::WaveletTransform::decompose(
            field, static_cast<double>(s), spectral::ScaleUnit::Months, config_.edge_trim);
        if (!pa) {
            throw PreconditionError(fmt::format(
                "wavelet decomposition failed at scale {} (series length {}, edge trim {} years)",
                s, field.size(), config_.edge_trim));
        }
        std::vector<double> sq(pa->amplitude.size());
        for (std::size_t t = 0; t < sq.size(); ++t) sq[t] = pa->amplitude[t] * pa->amplitude[t];
        amp_squared.push_back(std::move(sq));
        decomposed.push_back(std::move(*pa));
    }

    const std::size_t S = scales.size();
    auto bundle = results::MeasurementBundle::zeros(S);
    const auto pp_params = phase_phase_params();

    for (std::size_t i = 0; i < S; ++i) {
        const auto& phase_i = decomposed[i].phase;
        const auto  pa_params = phase_amp_params(scales[i]);

        for (std::size_t j = 0; j < S; ++j) {
            const auto& phase_j = decomposed[j].phase;
            const auto& amp_j   = decomposed[j].amplitude;
            const auto r = static_cast<Eigen::Index>(i);
            const auto c = static_cast<Eigen::Index>(j);

            // Phase-phase coherence.
            {
                const auto eqq = information::mutual_information(
                    phase_i, phase_j, information::BinnedEstimator::EQQ2, config_.bins);
                const auto knn = information::knn_mutual_information(
                    phase_i, phase_j, config_.k, config_.search);
                if (!eqq || !knn) fail(Measure::PhasePhaseCoherence, scales[i], scales[j],
                                       "estimator returned no value");
                bundle.phase_phase_coherence.eqq(r, c) = *eqq;
                bundle.phase_phase_coherence.knn(r, c) = *knn;
            }

            // Phase-amplitude mutual information.
            {
                const auto eqq = information::mutual_information(
                    phase_i, amp_j, information::BinnedEstimator::EQQ2, config_.bins);
                const auto knn = information::knn_mutual_information(
                    phase_i, amp_j, config_.k, config_.search);
                if (!eqq || !knn) fail(Measure::PhaseAmpMI, scales[i], scales[j],
                                       "estimator returned no value");
                bundle.phase_amp_mi.eqq(r, c) = *eqq;
                bundle.phase_amp_mi.knn(r, c) = *knn;
            }

            // Phase-phase causality.
            {
                const auto est = causality::CausalityAverager::average(phase_i, phase_j, pp_params);
                if (!est) fail(Measure::PhasePhaseCausality, scales[i], scales[j],
                               "lag sweep produced no value");
                bundle.phase_phase_causality.eqq(r, c) = est->eqq;
                bundle.phase_phase_causality.knn(r, c) = est->knn;
            }

            // Phase-amplitude causality.
            {
                const auto est = causality::CausalityAverager::average(phase_i, amp_squared[j],
                                                                       pa_params);
                if (!est) fail(Measure::PhaseAmpCausality, scales[i], scales[j],
                               fmt::format("lag sweep produced no value (smoothing {})",
                                           pa_params.smoothing));
                bundle.phase_amp_causality.eqq(r, c) = est->eqq;
                bundle.phase_amp_causality.knn(r, c) = est->knn;
            }
        }
    }
    return bundle;
}

} // namespace cmimap::grid
