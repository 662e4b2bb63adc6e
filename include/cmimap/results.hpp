#pragma once

/// @file include/cmimap/results.hpp
/// @brief Measurement bundle types and the Results Container.
///
/// # Module: Results
///
/// ## Responsibility
/// - `MeasurementBundle`: the four coupling-measure pairs of one realization,
///   as a fixed-arity record so arity errors cannot be expressed
/// - `MeasurementBundle::from_records`: rebuild a bundle from a loose
///   mapping (e.g. read back from disk) and enforce the 4 × 2 × array
///   contract at runtime
/// - `ResultsContainer`: validate one bundle or an ensemble, flatten to
///   `<measure>_<estimator>` keys (stacking an ensemble along a trailing
///   axis), and persist
///
/// ## Key Names
///   measures:   ph_ph_mi, ph_amp_mi, ph_ph_caus, ph_amp_caus
///   estimators: eqq, knn
///
/// ## Guarantees
/// - Construction is all-or-nothing: a container exists only if every
///   bundle passed validation
/// - `save` is the only I/O and writes atomically

#include "cmimap/archive.hpp"
#include "cmimap/types.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cmimap::results {

// ─── Names ────────────────────────────────────────────────────────────────────

enum class Measure {
    PhasePhaseCoherence,
    PhaseAmpMI,
    PhasePhaseCausality,
    PhaseAmpCausality,
};

/// Persisted order of the four measures.
inline constexpr std::array<Measure, 4> MEASURE_ORDER{
    Measure::PhasePhaseCoherence,
    Measure::PhaseAmpMI,
    Measure::PhasePhaseCausality,
    Measure::PhaseAmpCausality,
};

inline constexpr std::array<std::string_view, 2> ESTIMATOR_NAMES{"eqq", "knn"};

[[nodiscard]] std::string_view measure_name(Measure m) noexcept;

/// "<measure>_<estimator>", e.g. "ph_ph_mi_eqq".
[[nodiscard]] std::string key_for(Measure m, std::string_view estimator);

// ─── Bundle ───────────────────────────────────────────────────────────────────

/// One measure under both estimator families.
struct MeasurePair {
    Matrix eqq;
    Matrix knn;
};

/// Loose form of one measure: estimator name → array.
using MeasureRecord = std::map<std::string, NdArray>;

/// The four measure pairs of one realization (observed data or surrogate).
struct MeasurementBundle {
    MeasurePair phase_phase_coherence;
    MeasurePair phase_amp_mi;
    MeasurePair phase_phase_causality;
    MeasurePair phase_amp_causality;

    /// All pairs zero-filled with shape (s, s).
    [[nodiscard]] static MeasurementBundle zeros(std::size_t s);

    [[nodiscard]] const MeasurePair& get(Measure m) const noexcept;
    [[nodiscard]] MeasurePair& get(Measure m) noexcept;

    /// Side length S shared by every matrix (taken from the first one).
    [[nodiscard]] std::size_t scale_count() const noexcept;

    /// Throws `ValidationError` unless all eight matrices are square, of one
    /// shape, and non-empty.
    void validate() const;

    /// Rebuild from four loose records in MEASURE_ORDER.
    ///
    /// Throws `ValidationError` if there are not exactly 4 records, a record
    /// does not have exactly 2 keys (`eqq`, `knn`), or a value is not a
    /// rank-2 array.
    [[nodiscard]] static MeasurementBundle
    from_records(std::span<const MeasureRecord> records);

    /// Inverse of `from_records`.
    [[nodiscard]] std::vector<MeasureRecord> to_records() const;
};

// ─── ResultsContainer ─────────────────────────────────────────────────────────

class ResultsContainer {
public:
    /// Observed-data mode. Throws `ValidationError`.
    explicit ResultsContainer(MeasurementBundle bundle);

    /// Ensemble mode. Every bundle must validate and share S.
    /// Throws `ValidationError`.
    explicit ResultsContainer(std::vector<MeasurementBundle> ensemble);

    [[nodiscard]] bool is_ensemble() const noexcept { return ensemble_; }
    [[nodiscard]] std::size_t bundle_count() const noexcept { return bundles_.size(); }
    [[nodiscard]] const std::vector<MeasurementBundle>& bundles() const noexcept { return bundles_; }

    /// Eight keys. Observed: (S,S) arrays. Ensemble: (S,S,N) arrays with
    /// [:,:,k] taken from bundle k.
    [[nodiscard]] std::map<std::string, NdArray> flatten() const;

    /// Write `flatten()` to `path` atomically. Throws `IoError`.
    void save(const std::filesystem::path& path) const;

    /// Load an archive written by `save`. Rank-2 arrays give an observed
    /// container, rank-3 arrays an ensemble. Throws `IoError` or
    /// `ValidationError`.
    [[nodiscard]] static ResultsContainer from_saved_file(const std::filesystem::path& path);

private:
    std::vector<MeasurementBundle> bundles_;
    bool                           ensemble_;
};

} // namespace cmimap::results
