/// @file src/main.cpp
/// @brief cmimap CLI entry point.
///
/// Usage:
///   cmimap --config <ini> [overrides...]   Observed map + surrogate ensemble
///   cmimap --print-config [...]            Show the effective configuration
///   cmimap --help                          Print usage
///
/// Overrides are applied on top of the INI file (or the built-in defaults).

#include "cmimap/config.hpp"
#include "cmimap/errors.hpp"
#include "cmimap/pipeline.hpp"

#include <fmt/format.h>

#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  cmimap --config <ini> [overrides]   Run the cross-scale CMI map\n"
        "  cmimap --print-config [overrides]   Print the effective configuration\n"
        "  cmimap --help                       Show this help\n"
        "\n"
        "Overrides:\n"
        "  --data <csv>          dataset path\n"
        "  --layout <l>          series | gridded\n"
        "  --region <name>       NINO3.4 | NINO3 | NINO4 | NINO1.2 (gridded)\n"
        "  --first-date <date>   drop samples before YYYY-MM[-DD]\n"
        "  --scales <a:b[:s]>    scale span in months\n"
        "  --surrogates <N>      ensemble size\n"
        "  --workers <W>         worker threads\n"
        "  --algorithm <a>       FT | AAFT\n"
        "  --seed <n>            base seed of the ensemble\n"
        "  --bins <n>            EQQ bins per marginal\n"
        "  --k <n>               KNN neighbours\n"
        "  --max-lag <n>         causality lags 1..n-1\n"
        "  --edge-trim <years>   cone-of-influence trim\n"
        "  --brute-force         linear neighbour search instead of kd-tree\n"
        "  --timeout <s>         per-result wait limit (0 = none)\n"
        "  --output <prefix>     writes <prefix>_data.bin, <prefix>_surrogates.bin\n"
    );
}

struct Override {
    std::string_view flag;
    const char*      section;
    const char*      key;
};

constexpr Override OVERRIDES[] = {
    {"--data",       "data",       "path"},
    {"--layout",     "data",       "layout"},
    {"--region",     "data",       "region"},
    {"--first-date", "data",       "first_date"},
    {"--surrogates", "surrogates", "count"},
    {"--workers",    "surrogates", "workers"},
    {"--algorithm",  "surrogates", "algorithm"},
    {"--seed",       "surrogates", "seed"},
    {"--timeout",    "surrogates", "timeout_s"},
    {"--bins",       "estimators", "eqq_bins"},
    {"--k",          "estimators", "knn_k"},
    {"--max-lag",    "estimators", "max_lag"},
    {"--edge-trim",  "estimators", "edge_trim"},
    {"--output",     "output",     "prefix"},
};

/// Turn the command line into a RunConfig: defaults, then the INI file,
/// then flag overrides (expressed as a second INI document).
cmimap::RunConfig parse_args(const std::vector<std::string>& args) {
    cmimap::RunConfig cfg;
    std::string overrides;

    auto value_of = [&args](std::size_t& i) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw cmimap::ConfigError(args[i] + " requires a value");
        }
        return args[++i];
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--config") {
            cfg = cmimap::IniConfig::from_file(value_of(i)).apply(cfg);
            continue;
        }
        if (arg == "--brute-force") {
            overrides += "[estimators]\nkd_tree = false\n";
            continue;
        }
        if (arg == "--scales") {
            const std::string& span = value_of(i);
            const auto c1 = span.find(':');
            if (c1 == std::string::npos) {
                throw cmimap::ConfigError("--scales expects first:last[:step], got '" + span + "'");
            }
            const auto c2 = span.find(':', c1 + 1);
            overrides += "[scales]\nfirst = " + span.substr(0, c1) + "\n";
            overrides += "last = " + span.substr(c1 + 1, c2 == std::string::npos ? std::string::npos
                                                                                : c2 - c1 - 1) + "\n";
            if (c2 != std::string::npos) overrides += "step = " + span.substr(c2 + 1) + "\n";
            continue;
        }

        bool matched = false;
        for (const auto& o : OVERRIDES) {
            if (arg == o.flag) {
                overrides += fmt::format("[{}]\n{} = {}\n", o.section, o.key, value_of(i));
                matched = true;
                break;
            }
        }
        if (!matched) {
            throw cmimap::ConfigError("unknown option: " + arg);
        }
    }

    if (!overrides.empty()) {
        cfg = cmimap::IniConfig::from_string(overrides, "<command line>").apply(cfg);
    }
    return cfg;
}

void print_config(const cmimap::RunConfig& cfg) {
    fmt::print("data        {} ({}{}{})\n", cfg.data.path.string(),
               cfg.data.layout == cmimap::DataLayout::Series ? "series" : "gridded",
               cfg.data.region ? ", region " + *cfg.data.region : std::string(),
               cfg.data.first_date ? ", from " + cfg.data.first_date->to_string() : std::string());
    fmt::print("scales      {}..{} step {}\n", cfg.scales.first, cfg.scales.last, cfg.scales.step);
    fmt::print("estimators  eqq_bins={} knn_k={} max_lag={} edge_trim={} search={}\n",
               cfg.estimators.eqq_bins, cfg.estimators.knn_k, cfg.estimators.max_lag,
               cfg.estimators.edge_trim, cfg.estimators.kd_tree ? "kd-tree" : "brute-force");
    fmt::print("surrogates  count={} workers={} algorithm={} seed={} timeout={}s\n",
               cfg.surrogates.count, cfg.surrogates.workers,
               cmimap::to_string(cfg.surrogates.algorithm), cfg.surrogates.seed,
               cfg.surrogates.timeout.count());
    fmt::print("output      {} / {}\n", cfg.output.data_file().string(),
               cfg.output.surrogates_file().string());
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    const bool print_only = (mode == "--print-config");
    if (print_only) {
        args.erase(args.begin());
    }

    try {
        const auto cfg = parse_args(args);
        if (print_only) {
            print_config(cfg);
            if (auto problem = cfg.validate()) {
                fmt::print(stderr, "[FATAL] {}\n", *problem);
                return 1;
            }
            return 0;
        }

        const cmimap::core::Pipeline pipeline(cfg);
        const auto summary = pipeline.run();
        fmt::print("[cmimap] done: {}×{} grid, {} samples, {} surrogates\n",
                   summary.scale_count, summary.scale_count, summary.series_length,
                   summary.surrogate_count);
        return 0;
    } catch (const cmimap::Error& e) {
        fmt::print(stderr, "[FATAL] {}\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "[FATAL] unexpected: {}\n", e.what());
        return 1;
    }
}
