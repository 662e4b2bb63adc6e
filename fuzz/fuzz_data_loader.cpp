/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader CSV parsing and series reduction
 *
 * Build:
 *   cmake -DCMIMAP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence, in either layout.
 *   2. Every accepted sample has a finite value and a month in 1..12.
 *   3. Gridded samples have lat ∈ [−90, 90] and lon ∈ [0, 360).
 *   4. A reduced series is valid, gap-free and strictly monthly.
 *
 * The first input byte selects the layout and whether the NINO3.4 cut is
 * applied; the rest is the CSV text.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "cmimap/data_loader.hpp"

using namespace cmimap;
using namespace cmimap::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;

    const auto layout = (data[0] & 1) ? DataLayout::Gridded : DataLayout::Series;
    const bool cut    = (data[0] & 2) != 0 && layout == DataLayout::Gridded;
    const std::string_view csv{reinterpret_cast<const char*>(data + 1), size - 1};

    const auto parsed = DataLoader::parse_csv_string(csv, layout);
    for (const auto& s : parsed.samples) {
        assert(std::isfinite(s.value));
        assert(s.time.month >= 1 && s.time.month <= 12);
        if (layout == DataLayout::Gridded) {
            assert(s.lat >= -90.0 && s.lat <= 90.0);
            assert(s.lon >= 0.0 && s.lon < 360.0);
        }
    }

    const auto region = cut ? nino_region("NINO3.4") : std::nullopt;
    const auto series = DataLoader::reduce(parsed, region, std::nullopt);
    if (series) {
        assert(series->is_valid());
        assert(!series->empty());
        for (std::size_t i = 1; i < series->size(); ++i) {
            assert(series->timestamps[i].month_index() ==
                   series->timestamps[i - 1].month_index() + 1);
        }
    }
    return 0;
}
