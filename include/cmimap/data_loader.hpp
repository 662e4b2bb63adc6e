#pragma once

/// @file include/cmimap/data_loader.hpp
/// @brief CSV loader producing the single cleaned TimeSeries of a run.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse a CSV file into a 1-D monthly `TimeSeries`. Two layouts:
///   - `time,value`              already a single series
///   - `time,lat,lon,value`      gridded field in long format; rows are
///                                  optionally cut to a region box and then
///                                  averaged per timestamp (spatial mean)
///
/// `time` is `YYYY-MM` or `YYYY-MM-DD`. The first line is a header.
///
/// ## Guarantees
/// - Malformed or non-finite rows are skipped and counted, never fatal
/// - The returned series has strictly increasing, month-consecutive stamps
/// - Parsing functions are noexcept; only `load` reports through exceptions

#include "cmimap/config.hpp"
#include "cmimap/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cmimap::core {

/// Latitude/longitude box, bounds inclusive, longitude in [0, 360).
struct RegionBounds {
    double lat_min;
    double lat_max;
    double lon_min;
    double lon_max;

    [[nodiscard]] bool contains(double lat, double lon) const noexcept;
};

/// Bounds of a named NINO index region (NINO3.4, NINO3, NINO4, NINO1.2).
[[nodiscard]] std::optional<RegionBounds> nino_region(std::string_view name) noexcept;

/// One parsed CSV row. `lat`/`lon` are NaN in the series layout.
struct FieldSample {
    Date   time;
    double lat;
    double lon;
    double value;
};

/// Outcome of parsing: samples plus the count of skipped rows.
struct ParsedField {
    std::vector<FieldSample> samples;
    std::size_t              skipped = 0;
};

class DataLoader {
public:
    /// Parse CSV text in the given layout (first line = header).
    [[nodiscard]] static ParsedField
    parse_csv_string(std::string_view csv, DataLayout layout) noexcept;

    /// Reduce parsed samples to one value per timestamp.
    ///
    /// Rows outside `region` are dropped, rows before `first_date` are
    /// dropped, then samples sharing a timestamp are averaged.
    ///
    /// # Returns
    /// `nullopt` if nothing survives the filters, a series-layout month
    /// appears twice (the data is not 1-D), or the timestamps are not
    /// month-consecutive after reduction.
    [[nodiscard]] static std::optional<TimeSeries>
    reduce(const ParsedField& field,
           const std::optional<RegionBounds>& region,
           const std::optional<Date>& first_date) noexcept;

    /// Load and reduce the file described by `cfg`.
    ///
    /// Throws `IoError` if the file cannot be read and `PreconditionError`
    /// if the reduced data is not a single monthly series.
    [[nodiscard]] static TimeSeries load(const DataConfig& cfg);

private:
    [[nodiscard]] static std::optional<FieldSample>
    parse_row(std::string_view line, DataLayout layout) noexcept;
};

} // namespace cmimap::core
