/// @file src/results/results_container.cpp
/// @brief MeasurementBundle contract and the ResultsContainer.

#include "cmimap/results.hpp"
#include "cmimap/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace cmimap::results {

namespace {

NdArray to_array(const Matrix& m) {
    NdArray a;
    a.shape = {static_cast<std::size_t>(m.rows()), static_cast<std::size_t>(m.cols())};
    a.data.resize(static_cast<std::size_t>(m.size()));
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        for (Eigen::Index j = 0; j < m.cols(); ++j) {
            a.data[static_cast<std::size_t>(i * m.cols() + j)] = m(i, j);
        }
    }
    return a;
}

Matrix to_matrix(const NdArray& a) {
    Matrix m(static_cast<Eigen::Index>(a.shape[0]), static_cast<Eigen::Index>(a.shape[1]));
    for (std::size_t i = 0; i < a.shape[0]; ++i) {
        for (std::size_t j = 0; j < a.shape[1]; ++j) {
            m(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = a.data[i * a.shape[1] + j];
        }
    }
    return m;
}

} // namespace

// ─── Names ────────────────────────────────────────────────────────────────────

std::string_view measure_name(Measure m) noexcept {
    switch (m) {
        case Measure::PhasePhaseCoherence: return "ph_ph_mi";
        case Measure::PhaseAmpMI:          return "ph_amp_mi";
        case Measure::PhasePhaseCausality: return "ph_ph_caus";
        case Measure::PhaseAmpCausality:   return "ph_amp_caus";
    }
    return "?";
}

std::string key_for(Measure m, std::string_view estimator) {
    return fmt::format("{}_{}", measure_name(m), estimator);
}

// ─── MeasurementBundle ────────────────────────────────────────────────────────

MeasurementBundle MeasurementBundle::zeros(std::size_t s) {
    const auto n = static_cast<Eigen::Index>(s);
    const MeasurePair zero{Matrix::Zero(n, n), Matrix::Zero(n, n)};
    return MeasurementBundle{zero, zero, zero, zero};
}

const MeasurePair& MeasurementBundle::get(Measure m) const noexcept {
    switch (m) {
        case Measure::PhasePhaseCoherence: return phase_phase_coherence;
        case Measure::PhaseAmpMI:          return phase_amp_mi;
        case Measure::PhasePhaseCausality: return phase_phase_causality;
        case Measure::PhaseAmpCausality:   return phase_amp_causality;
    }
    return phase_phase_coherence;
}

MeasurePair& MeasurementBundle::get(Measure m) noexcept {
    return const_cast<MeasurePair&>(std::as_const(*this).get(m));
}

std::size_t MeasurementBundle::scale_count() const noexcept {
    return static_cast<std::size_t>(phase_phase_coherence.eqq.rows());
}

void MeasurementBundle::validate() const {
    const auto s = phase_phase_coherence.eqq.rows();
    if (s == 0) {
        throw ValidationError("measurement bundle is empty (0×0 matrices)");
    }
    for (Measure m : MEASURE_ORDER) {
        const auto& pair = get(m);
        for (const auto* mat : {&pair.eqq, &pair.knn}) {
            if (mat->rows() != s || mat->cols() != s) {
                throw ValidationError(fmt::format(
                    "measure {} has shape ({}, {}), expected ({}, {})",
                    measure_name(m), mat->rows(), mat->cols(), s, s));
            }
        }
    }
}

MeasurementBundle MeasurementBundle::from_records(std::span<const MeasureRecord> records) {
    if (records.size() != MEASURE_ORDER.size()) {
        throw ValidationError(fmt::format(
            "a measurement bundle needs exactly {} measures, got {}",
            MEASURE_ORDER.size(), records.size()));
    }

    MeasurementBundle bundle;
    for (std::size_t r = 0; r < records.size(); ++r) {
        const Measure m = MEASURE_ORDER[r];
        const auto& record = records[r];
        if (record.size() != ESTIMATOR_NAMES.size()) {
            throw ValidationError(fmt::format(
                "measure {} needs exactly {} estimator results (eqq, knn), got {}",
                measure_name(m), ESTIMATOR_NAMES.size(), record.size()));
        }

        auto& pair = bundle.get(m);
        for (std::string_view est : ESTIMATOR_NAMES) {
            auto it = record.find(std::string(est));
            if (it == record.end()) {
                throw ValidationError(fmt::format("measure {} is missing estimator '{}'",
                                                  measure_name(m), est));
            }
            const NdArray& a = it->second;
            if (a.rank() != 2 || !a.is_consistent()) {
                throw ValidationError(fmt::format(
                    "measure {} estimator '{}' is not a 2-D array (rank {})",
                    measure_name(m), est, a.rank()));
            }
            (est == "eqq" ? pair.eqq : pair.knn) = to_matrix(a);
        }
    }
    bundle.validate();
    return bundle;
}

std::vector<MeasureRecord> MeasurementBundle::to_records() const {
    std::vector<MeasureRecord> out;
    out.reserve(MEASURE_ORDER.size());
    for (Measure m : MEASURE_ORDER) {
        const auto& pair = get(m);
        out.push_back(MeasureRecord{{"eqq", to_array(pair.eqq)}, {"knn", to_array(pair.knn)}});
    }
    return out;
}

// ─── ResultsContainer ─────────────────────────────────────────────────────────

ResultsContainer::ResultsContainer(MeasurementBundle bundle) : ensemble_(false) {
    bundle.validate();
    bundles_.push_back(std::move(bundle));
}

ResultsContainer::ResultsContainer(std::vector<MeasurementBundle> ensemble)
    : bundles_(std::move(ensemble)), ensemble_(true) {
    if (bundles_.empty()) {
        throw ValidationError("surrogate ensemble is empty");
    }
    const std::size_t s = bundles_.front().scale_count();
    for (std::size_t k = 0; k < bundles_.size(); ++k) {
        bundles_[k].validate();
        if (bundles_[k].scale_count() != s) {
            throw ValidationError(fmt::format(
                "ensemble member {} has {} scales, member 0 has {}",
                k, bundles_[k].scale_count(), s));
        }
    }
}

std::map<std::string, NdArray> ResultsContainer::flatten() const {
    std::map<std::string, NdArray> out;
    const std::size_t s = bundles_.front().scale_count();
    const std::size_t n = bundles_.size();

    for (Measure m : MEASURE_ORDER) {
        for (std::string_view est : ESTIMATOR_NAMES) {
            NdArray a;
            if (!ensemble_) {
                const auto& pair = bundles_.front().get(m);
                a = to_array(est == "eqq" ? pair.eqq : pair.knn);
            } else {
                a.shape = {s, s, n};
                a.data.resize(s * s * n);
                for (std::size_t k = 0; k < n; ++k) {
                    const auto& pair = bundles_[k].get(m);
                    const Matrix& mat = (est == "eqq") ? pair.eqq : pair.knn;
                    for (std::size_t i = 0; i < s; ++i) {
                        for (std::size_t j = 0; j < s; ++j) {
                            a.data[(i * s + j) * n + k] =
                                mat(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
                        }
                    }
                }
            }
            out.emplace(key_for(m, est), std::move(a));
        }
    }
    return out;
}

void ResultsContainer::save(const std::filesystem::path& path) const {
    archive::save(path, flatten());
}

ResultsContainer ResultsContainer::from_saved_file(const std::filesystem::path& path) {
    const ArrayMap arrays = archive::load(path);

    const std::size_t expected_keys = MEASURE_ORDER.size() * ESTIMATOR_NAMES.size();
    if (arrays.size() != expected_keys) {
        throw ValidationError(fmt::format("{}: expected {} arrays, found {}",
                                          path.string(), expected_keys, arrays.size()));
    }

    auto lookup = [&](Measure m, std::string_view est) -> const NdArray& {
        auto it = arrays.find(key_for(m, est));
        if (it == arrays.end()) {
            throw ValidationError(fmt::format("{}: missing array '{}'", path.string(), key_for(m, est)));
        }
        return it->second;
    };

    const std::size_t rank = lookup(MEASURE_ORDER[0], ESTIMATOR_NAMES[0]).rank();
    if (rank == 2) {
        std::vector<MeasureRecord> records;
        for (Measure m : MEASURE_ORDER) {
            records.push_back(MeasureRecord{{"eqq", lookup(m, "eqq")}, {"knn", lookup(m, "knn")}});
        }
        return ResultsContainer(MeasurementBundle::from_records(records));
    }
    if (rank != 3) {
        throw ValidationError(fmt::format("{}: arrays must be rank 2 or 3, found rank {}",
                                          path.string(), rank));
    }

    // Ensemble: slice [:, :, k] of every array into bundle k.
    const auto& first = lookup(MEASURE_ORDER[0], ESTIMATOR_NAMES[0]);
    const std::size_t s = first.shape[0];
    const std::size_t n = first.shape[2];
    std::vector<MeasurementBundle> ensemble;
    ensemble.reserve(n);
    for (std::size_t k = 0; k < n; ++k) {
        std::vector<MeasureRecord> records;
        for (Measure m : MEASURE_ORDER) {
            MeasureRecord record;
            for (std::string_view est : ESTIMATOR_NAMES) {
                const NdArray& a = lookup(m, est);
                if (a.shape != first.shape) {
                    throw ValidationError(fmt::format("{}: array '{}' shape differs from '{}'",
                                                      path.string(), key_for(m, est),
                                                      key_for(MEASURE_ORDER[0], ESTIMATOR_NAMES[0])));
                }
                NdArray slice;
                slice.shape = {s, a.shape[1]};
                slice.data.resize(s * a.shape[1]);
                for (std::size_t i = 0; i < s; ++i) {
                    for (std::size_t j = 0; j < a.shape[1]; ++j) {
                        slice.data[i * a.shape[1] + j] = a.data[(i * a.shape[1] + j) * n + k];
                    }
                }
                record.emplace(std::string(est), std::move(slice));
            }
            records.push_back(std::move(record));
        }
        ensemble.push_back(MeasurementBundle::from_records(records));
    }
    return ResultsContainer(std::move(ensemble));
}

} // namespace cmimap::results
