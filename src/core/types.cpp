/// @file src/core/types.cpp
/// @brief Date formatting and ScaleGrid construction.

#include "cmimap/types.hpp"

#include <fmt/format.h>

#include <new>

namespace cmimap {

// ─── Date ─────────────────────────────────────────────────────────────────────

std::string Date::to_string() const {
    return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

// ─── ScaleGrid ────────────────────────────────────────────────────────────────

std::optional<ScaleGrid> ScaleGrid::make(int first, int last, int step) noexcept {
    if (first < 1 || step < 1 || last < first) {
        return std::nullopt;
    }
    std::vector<int> scales;
    try {
        const int count = (last - first) / step + 1;
        scales.reserve(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i) {
            scales.push_back(first + i * step);
        }
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
    return ScaleGrid(std::move(scales));
}

std::optional<ScaleGrid> ScaleGrid::from_values(std::vector<int> scales) noexcept {
    if (scales.empty() || scales.front() < 1) {
        return std::nullopt;
    }
    for (std::size_t i = 1; i < scales.size(); ++i) {
        if (scales[i] <= scales[i - 1]) {
            return std::nullopt;
        }
    }
    return ScaleGrid(std::move(scales));
}

} // namespace cmimap
