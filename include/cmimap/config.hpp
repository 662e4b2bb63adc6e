#pragma once

/// @file include/cmimap/config.hpp
/// @brief Run configuration: one immutable struct threaded through the run.
///
/// # Module: Config
///
/// ## Responsibility
/// Hold every process parameter (scale span, ensemble size, worker count,
/// estimator settings, paths) in a single value. Defaults come from
/// `constants.hpp`; an INI file and CLI flags may override them.
///
/// ## INI Layout
/// ```
/// [data]
/// path       = data/nino34_tas.csv
/// layout     = series          ; series | gridded
/// region     = NINO3.4         ; gridded layout only, optional
/// first_date = 1900-01-01      ; optional
///
/// [scales]
/// first = 5
/// last  = 96
/// step  = 1
///
/// [estimators]
/// eqq_bins  = 4
/// knn_k     = 64
/// max_lag   = 7
/// edge_trim = 1                ; years
/// kd_tree   = true
///
/// [surrogates]
/// count     = 100
/// workers   = 20
/// algorithm = FT               ; FT | AAFT
/// seed      = 1592638206
/// timeout_s = 0                ; 0 = wait indefinitely
///
/// [output]
/// prefix = bins/tas_Amon_MPI-ESM-HR
/// ```

#include "cmimap/constants.hpp"
#include "cmimap/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cmimap {

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Column layout of the input CSV.
enum class DataLayout {
    Series,   ///< time,value
    Gridded,  ///< time,lat,lon,value (long format, spatially averaged on load)
};

/// Surrogate synthesis algorithm.
enum class SurrogateAlgorithm {
    FT,    ///< Fourier-transform phase randomization
    AAFT,  ///< Amplitude-adjusted FT
};

[[nodiscard]] std::optional<DataLayout> parse_layout(std::string_view s) noexcept;
[[nodiscard]] std::optional<SurrogateAlgorithm> parse_algorithm(std::string_view s) noexcept;
[[nodiscard]] std::string_view to_string(SurrogateAlgorithm a) noexcept;

// ─── RunConfig ────────────────────────────────────────────────────────────────

struct DataConfig {
    std::filesystem::path      path;
    DataLayout                 layout = DataLayout::Series;
    std::optional<std::string> region;      ///< NINO region name (gridded only)
    std::optional<Date>        first_date;
};

struct ScaleConfig {
    int first = constants::DEFAULT_PERIOD_FIRST;
    int last  = constants::DEFAULT_PERIOD_LAST;
    int step  = constants::DEFAULT_PERIOD_STEP;
};

struct EstimatorConfig {
    int  eqq_bins  = constants::DEFAULT_EQQ_BINS;
    int  knn_k     = constants::DEFAULT_KNN_K;
    int  max_lag   = constants::DEFAULT_MAX_LAG;
    int  edge_trim = constants::DEFAULT_EDGE_TRIM_YEARS;
    bool kd_tree   = true;  ///< accelerated neighbour search
};

struct SurrogateConfig {
    std::size_t               count     = constants::DEFAULT_NUM_SURROGATES;
    std::size_t               workers   = constants::DEFAULT_WORKERS;
    SurrogateAlgorithm        algorithm = SurrogateAlgorithm::FT;
    unsigned long long        seed      = constants::DEFAULT_SEED;
    std::chrono::seconds      timeout{0};  ///< 0 = block until every result arrives
};

struct OutputConfig {
    std::string prefix = "cmimap";

    [[nodiscard]] std::filesystem::path data_file() const { return prefix + "_data.bin"; }
    [[nodiscard]] std::filesystem::path surrogates_file() const { return prefix + "_surrogates.bin"; }
};

/// Complete parameter set of one run.
struct RunConfig {
    DataConfig      data;
    ScaleConfig     scales;
    EstimatorConfig estimators;
    SurrogateConfig surrogates;
    OutputConfig    output;

    /// Check ranges and cross-field constraints.
    ///
    /// # Returns
    /// `nullopt` if the config is usable, otherwise a message naming the
    /// first offending field.
    [[nodiscard]] std::optional<std::string> validate() const;

    /// Scale grid described by `scales`; `nullopt` if the span is empty.
    [[nodiscard]] std::optional<ScaleGrid> scale_grid() const noexcept;
};

// ─── IniConfig ────────────────────────────────────────────────────────────────

/// Minimal INI reader: `[section]`, `key = value`, `#`/`;` comments, quotes
/// stripped from values. Throws `ConfigError` on malformed lines.
class IniConfig {
public:
    [[nodiscard]] static IniConfig from_file(const std::filesystem::path& file);
    [[nodiscard]] static IniConfig from_string(std::string_view text,
                                               std::string source = "<string>");

    [[nodiscard]] bool has_key(const std::string& section, const std::string& key) const;

    [[nodiscard]] std::optional<std::string>
    get(const std::string& section, const std::string& key) const;

    /// Apply every recognised key on top of `base`. Unknown keys in known
    /// sections are rejected so typos fail loudly.
    [[nodiscard]] RunConfig apply(RunConfig base) const;

    [[nodiscard]] const std::string& source() const noexcept { return source_; }

private:
    explicit IniConfig(std::string source) : source_(std::move(source)) {}

    void parse(std::string_view text);

    std::string source_;
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;
};

/// Parse "YYYY-MM" or "YYYY-MM-DD". `nullopt` on any malformed component.
[[nodiscard]] std::optional<Date> parse_date(std::string_view s) noexcept;

} // namespace cmimap
