/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader: series and gridded layouts, region mean.

#include "cmimap/data_loader.hpp"
#include "cmimap/errors.hpp"

#include <fmt/core.h>

#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <string>

namespace cmimap::core {

namespace {

/// Split on commas into trimmed tokens.
std::vector<std::string_view> split_csv(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        auto token = line.substr(start, comma == std::string_view::npos ? line.size() - start
                                                                         : comma - start);
        const auto first = token.find_first_not_of(" \t\r\n");
        const auto last  = token.find_last_not_of(" \t\r\n");
        fields.push_back(first == std::string_view::npos
                             ? std::string_view{}
                             : token.substr(first, last - first + 1));
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return fields;
}

std::optional<double> safe_parse_double(std::string_view s) noexcept {
    if (s.empty()) return std::nullopt;
    try {
        const std::string tmp(s);
        std::size_t pos = 0;
        const double v = std::stod(tmp, &pos);
        if (pos != tmp.size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

double normalize_longitude(double lon) noexcept {
    double l = std::fmod(lon, 360.0);
    if (l < 0.0) l += 360.0;
    // −tiny + 360 rounds to 360.
    return l >= 360.0 ? 0.0 : l;
}

} // namespace

// ─── RegionBounds ─────────────────────────────────────────────────────────────

bool RegionBounds::contains(double lat, double lon) const noexcept {
    const double l = normalize_longitude(lon);
    return lat >= lat_min && lat <= lat_max && l >= lon_min && l <= lon_max;
}

std::optional<RegionBounds> nino_region(std::string_view name) noexcept {
    if (name == "NINO3.4") return RegionBounds{-5.0,  5.0, 190.0, 240.0};
    if (name == "NINO3")   return RegionBounds{-5.0,  5.0, 210.0, 270.0};
    if (name == "NINO4")   return RegionBounds{-5.0,  5.0, 160.0, 210.0};
    if (name == "NINO1.2") return RegionBounds{-10.0, 0.0, 270.0, 280.0};
    return std::nullopt;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<FieldSample>
DataLoader::parse_row(std::string_view line, DataLayout layout) noexcept {
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    std::vector<std::string_view> fields;
    try {
        fields = split_csv(line);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    const std::size_t expected = (layout == DataLayout::Series) ? 2 : 4;
    if (fields.size() != expected) {
        return std::nullopt;
    }

    const auto time = parse_date(fields[0]);
    if (!time) {
        return std::nullopt;
    }

    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    if (layout == DataLayout::Series) {
        const auto value = safe_parse_double(fields[1]);
        if (!value) return std::nullopt;
        return FieldSample{*time, nan, nan, *value};
    }

    const auto lat   = safe_parse_double(fields[1]);
    const auto lon   = safe_parse_double(fields[2]);
    const auto value = safe_parse_double(fields[3]);
    if (!lat || !lon || !value) return std::nullopt;
    if (*lat < -90.0 || *lat > 90.0) return std::nullopt;

    return FieldSample{*time, *lat, normalize_longitude(*lon), *value};
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

ParsedField
DataLoader::parse_csv_string(std::string_view csv, DataLayout layout) noexcept {
    ParsedField out;
    bool header_skipped = false;
    std::size_t pos = 0;

    try {
        while (pos < csv.size()) {
            const auto eol = csv.find('\n', pos);
            auto line = csv.substr(pos, eol == std::string_view::npos ? csv.size() - pos
                                                                      : eol - pos);
            pos = (eol == std::string_view::npos) ? csv.size() : eol + 1;

            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }

            if (!header_skipped) {
                // First non-empty, non-comment line is the header.
                if (!line.empty() && line[0] != '#') {
                    header_skipped = true;
                }
                continue;
            }
            if (line.empty() || line[0] == '#') {
                continue;
            }

            if (auto sample = parse_row(line, layout)) {
                out.samples.push_back(*sample);
            } else {
                ++out.skipped;
            }
        }
    } catch (const std::exception&) {
        // Allocation failure: report what was parsed so far.
    }
    return out;
}

// ─── DataLoader::reduce ───────────────────────────────────────────────────────

std::optional<TimeSeries>
DataLoader::reduce(const ParsedField& field,
                   const std::optional<RegionBounds>& region,
                   const std::optional<Date>& first_date) noexcept {
    try {
        // Spatial mean per timestamp, keyed by month so duplicates collapse.
        std::map<long, std::pair<double, std::size_t>> sums;
        std::map<long, Date> dates;

        for (const auto& s : field.samples) {
            if (region && !(std::isfinite(s.lat) && region->contains(s.lat, s.lon))) {
                continue;
            }
            if (first_date && s.time < *first_date) {
                continue;
            }
            const long key = s.time.month_index();
            if (!std::isfinite(s.lat) && sums.count(key) > 0) {
                // Series layout with a repeated month: not a 1-D series.
                return std::nullopt;
            }
            auto& acc = sums[key];
            acc.first  += s.value;
            acc.second += 1;
            dates.emplace(key, Date{s.time.year, s.time.month, 1});
        }

        if (sums.empty()) {
            return std::nullopt;
        }

        TimeSeries ts;
        ts.values.reserve(sums.size());
        ts.timestamps.reserve(sums.size());

        long prev = sums.begin()->first - 1;
        for (const auto& [key, acc] : sums) {
            if (key != prev + 1) {
                // Gap in the monthly record.
                return std::nullopt;
            }
            prev = key;
            ts.values.push_back(acc.first / static_cast<double>(acc.second));
            ts.timestamps.push_back(dates.at(key));
        }
        return ts;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ─── DataLoader::load ─────────────────────────────────────────────────────────

TimeSeries DataLoader::load(const DataConfig& cfg) {
    std::ifstream file(cfg.path);
    if (!file.is_open()) {
        throw IoError("cannot open dataset: " + cfg.path.string());
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    std::optional<RegionBounds> region;
    if (cfg.region) {
        region = nino_region(*cfg.region);
        if (!region) {
            throw PreconditionError("unknown region '" + *cfg.region +
                                    "' (expected NINO3.4, NINO3, NINO4 or NINO1.2)");
        }
    }

    const auto parsed = parse_csv_string(contents.str(), cfg.layout);
    if (parsed.skipped > 0) {
        fmt::print(stderr, "[cmimap] skipped {} malformed rows in '{}'\n",
                   parsed.skipped, cfg.path.string());
    }

    auto series = reduce(parsed, region, cfg.first_date);
    if (!series) {
        throw PreconditionError(
            "dataset '" + cfg.path.string() +
            "' does not reduce to a single gap-free monthly series");
    }
    return std::move(*series);
}

} // namespace cmimap::core
