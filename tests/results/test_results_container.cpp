/// @file tests/results/test_results_container.cpp
/// @brief Unit tests for MeasurementBundle and ResultsContainer.
///
/// Test categories:
///   - Observed mode: eight (S,S) arrays under the persisted key names
///   - Record contract: 4 measures × 2 estimators × rank-2 arrays
///   - Ensemble mode: (S,S,N) stacking with [:,:,k] = bundle k
///   - Persistence round trip through from_saved_file

#include "cmimap/results.hpp"
#include "cmimap/errors.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <set>

using namespace cmimap;
using namespace cmimap::results;

namespace {

/// Bundle whose every cell encodes (tag, measure, estimator, i, j).
MeasurementBundle tagged_bundle(std::size_t s, double tag) {
    auto b = MeasurementBundle::zeros(s);
    int m_idx = 0;
    for (Measure m : MEASURE_ORDER) {
        auto& pair = b.get(m);
        for (Eigen::Index i = 0; i < pair.eqq.rows(); ++i) {
            for (Eigen::Index j = 0; j < pair.eqq.cols(); ++j) {
                pair.eqq(i, j) = tag * 1000 + m_idx * 100 + static_cast<double>(i * 10 + j);
                pair.knn(i, j) = -pair.eqq(i, j);
            }
        }
        ++m_idx;
    }
    return b;
}

std::vector<MeasureRecord> valid_records(std::size_t s) {
    return tagged_bundle(s, 1.0).to_records();
}

} // namespace

// ─── Test 1: Names ────────────────────────────────────────────────────────────

TEST(Results, KeyNames) {
    EXPECT_EQ(key_for(Measure::PhasePhaseCoherence, "eqq"), "ph_ph_mi_eqq");
    EXPECT_EQ(key_for(Measure::PhaseAmpMI, "knn"), "ph_amp_mi_knn");
    EXPECT_EQ(key_for(Measure::PhasePhaseCausality, "eqq"), "ph_ph_caus_eqq");
    EXPECT_EQ(key_for(Measure::PhaseAmpCausality, "knn"), "ph_amp_caus_knn");
}

// ─── Test 2: Observed mode ────────────────────────────────────────────────────

TEST(ResultsContainer, ObservedFlattensToEightSquareArrays) {
    const ResultsContainer c(tagged_bundle(3, 0.0));
    EXPECT_FALSE(c.is_ensemble());
    const auto flat = c.flatten();
    ASSERT_EQ(flat.size(), 8u);

    std::set<std::string> keys;
    for (const auto& [key, arr] : flat) {
        keys.insert(key);
        EXPECT_EQ(arr.shape, (std::vector<std::size_t>{3, 3})) << key;
    }
    for (Measure m : MEASURE_ORDER) {
        for (auto est : ESTIMATOR_NAMES) EXPECT_EQ(keys.count(key_for(m, est)), 1u);
    }
    EXPECT_DOUBLE_EQ(flat.at("ph_amp_mi_eqq").at(1, 2), 100.0 + 12.0);
    EXPECT_DOUBLE_EQ(flat.at("ph_amp_mi_knn").at(1, 2), -112.0);
}

TEST(ResultsContainer, NonSquareBundleRejected) {
    auto b = tagged_bundle(3, 0.0);
    b.phase_amp_causality.knn = Matrix::Zero(3, 2);
    EXPECT_THROW(ResultsContainer{b}, ValidationError);
}

TEST(ResultsContainer, MixedShapeBundleRejected) {
    auto b = tagged_bundle(3, 0.0);
    b.phase_phase_causality.eqq = Matrix::Zero(4, 4);
    EXPECT_THROW(b.validate(), ValidationError);
}

TEST(ResultsContainer, EmptyBundleRejected) {
    EXPECT_THROW(ResultsContainer{MeasurementBundle{}}, ValidationError);
}

// ─── Test 3: Record contract ──────────────────────────────────────────────────

TEST(MeasurementBundle, FromRecordsRoundTrip) {
    const auto b = tagged_bundle(2, 5.0);
    const auto back = MeasurementBundle::from_records(b.to_records());
    for (Measure m : MEASURE_ORDER) {
        EXPECT_EQ(back.get(m).eqq, b.get(m).eqq);
        EXPECT_EQ(back.get(m).knn, b.get(m).knn);
    }
}

TEST(MeasurementBundle, WrongMeasureCountRejected) {
    auto records = valid_records(2);
    records.pop_back();
    EXPECT_THROW((void)MeasurementBundle::from_records(records), ValidationError);

    records = valid_records(2);
    records.push_back(records.front());
    EXPECT_THROW((void)MeasurementBundle::from_records(records), ValidationError);
}

TEST(MeasurementBundle, WrongEstimatorCountRejected) {
    auto records = valid_records(2);
    records[1].erase("knn");
    EXPECT_THROW((void)MeasurementBundle::from_records(records), ValidationError);

    records = valid_records(2);
    records[2]["gcm"] = records[2]["eqq"];
    EXPECT_THROW((void)MeasurementBundle::from_records(records), ValidationError);

    records = valid_records(2);
    records[0].erase("eqq");
    records[0]["EQQ"] = records[0]["knn"];
    EXPECT_THROW((void)MeasurementBundle::from_records(records), ValidationError);
}

TEST(MeasurementBundle, NonArrayValueRejected) {
    auto records = valid_records(2);
    records[3]["eqq"] = NdArray{{}, {1.0}};  // scalar
    EXPECT_THROW((void)MeasurementBundle::from_records(records), ValidationError);

    records = valid_records(2);
    records[0]["knn"] = NdArray{{4}, {1, 2, 3, 4}};
    EXPECT_THROW((void)MeasurementBundle::from_records(records), ValidationError);

    records = valid_records(2);
    records[0]["knn"] = NdArray{{2, 2}, {1, 2, 3}};  // inconsistent
    EXPECT_THROW((void)MeasurementBundle::from_records(records), ValidationError);
}

// ─── Test 4: Ensemble mode ────────────────────────────────────────────────────

TEST(ResultsContainer, EnsembleStacksAlongTrailingAxis) {
    std::vector<MeasurementBundle> ensemble;
    for (int k = 0; k < 3; ++k) ensemble.push_back(tagged_bundle(4, k));
    const ResultsContainer c(ensemble);
    EXPECT_TRUE(c.is_ensemble());
    EXPECT_EQ(c.bundle_count(), 3u);

    const auto flat = c.flatten();
    ASSERT_EQ(flat.size(), 8u);
    for (const auto& [key, arr] : flat) {
        EXPECT_EQ(arr.shape, (std::vector<std::size_t>{4, 4, 3})) << key;
    }

    for (Measure m : MEASURE_ORDER) {
        const auto& arr = flat.at(key_for(m, "eqq"));
        for (std::size_t k = 0; k < 3; ++k) {
            const auto& mat = ensemble[k].get(m).eqq;
            for (std::size_t i = 0; i < 4; ++i) {
                for (std::size_t j = 0; j < 4; ++j) {
                    EXPECT_DOUBLE_EQ(arr.at(i, j, k),
                                     mat(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)));
                }
            }
        }
    }
}

TEST(ResultsContainer, EnsembleWithMixedScaleCountsRejected) {
    std::vector<MeasurementBundle> ensemble{tagged_bundle(3, 0), tagged_bundle(4, 1)};
    EXPECT_THROW(ResultsContainer{ensemble}, ValidationError);
}

TEST(ResultsContainer, EmptyEnsembleRejected) {
    EXPECT_THROW(ResultsContainer{std::vector<MeasurementBundle>{}}, ValidationError);
}

// ─── Test 5: Persistence ──────────────────────────────────────────────────────

TEST(ResultsContainer, SaveAndReloadObserved) {
    const auto path = std::filesystem::temp_directory_path() / "cmimap_results_observed.bin";
    const ResultsContainer c(tagged_bundle(3, 2.0));
    c.save(path);

    const auto back = ResultsContainer::from_saved_file(path);
    EXPECT_FALSE(back.is_ensemble());
    EXPECT_EQ(back.flatten(), c.flatten());
    std::filesystem::remove(path);
}

TEST(ResultsContainer, SaveAndReloadEnsemble) {
    const auto path = std::filesystem::temp_directory_path() / "cmimap_results_ensemble.bin";
    std::vector<MeasurementBundle> ensemble{tagged_bundle(2, 0), tagged_bundle(2, 1)};
    const ResultsContainer c(ensemble);
    c.save(path);

    const auto back = ResultsContainer::from_saved_file(path);
    EXPECT_TRUE(back.is_ensemble());
    EXPECT_EQ(back.bundle_count(), 2u);
    EXPECT_EQ(back.flatten(), c.flatten());
    std::filesystem::remove(path);
}

TEST(ResultsContainer, ReloadRejectsForeignArchive) {
    const auto path = std::filesystem::temp_directory_path() / "cmimap_results_foreign.bin";
    archive::save(path, ArrayMap{{"temperature", NdArray{{2, 2}, {1, 2, 3, 4}}}});
    EXPECT_THROW((void)ResultsContainer::from_saved_file(path), ValidationError);
    std::filesystem::remove(path);
}
