/**
 * @file  fuzz_config.cpp
 * @brief libFuzzer target for the INI reader and RunConfig overrides
 *
 * Build:
 *   cmake -DCMIMAP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_config
 *
 * Run for 60 seconds:
 *   ./fuzz_config -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. Any text either parses or throws ConfigError.
 *   2. A parsed file applies cleanly or throws ConfigError.
 *   3. A config that passes validate() describes a non-empty scale range,
 *      and any grid built from it starts at scales.first.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "cmimap/config.hpp"
#include "cmimap/errors.hpp"

using namespace cmimap;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view text{reinterpret_cast<const char*>(data), size};

    RunConfig cfg;
    try {
        cfg = IniConfig::from_string(text, "<fuzz>").apply(RunConfig{});
    } catch (const ConfigError&) {
        return 0;
    }

    if (!cfg.validate()) {
        assert(cfg.scales.first >= 1 && cfg.scales.last >= cfg.scales.first);
        // Very wide ranges may fail to allocate; those report nullopt.
        if (const auto grid = cfg.scale_grid()) {
            assert(grid->size() > 0);
            assert((*grid)[0] == cfg.scales.first);
        }
    }
    return 0;
}
