/// @file src/core/config.cpp
/// @brief RunConfig validation and the INI reader.

#include "cmimap/config.hpp"
#include "cmimap/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>

namespace cmimap {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string_view strip_quotes(std::string_view s) noexcept {
    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

template <typename T>
std::optional<T> parse_number(std::string_view s) noexcept {
    T value{};
    const auto* first = s.data();
    const auto* last  = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

std::optional<bool> parse_bool(std::string_view s) {
    const auto v = to_lower(s);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

} // namespace

// ─── Enumerations ─────────────────────────────────────────────────────────────

std::optional<DataLayout> parse_layout(std::string_view s) noexcept {
    if (s == "series")  return DataLayout::Series;
    if (s == "gridded") return DataLayout::Gridded;
    return std::nullopt;
}

std::optional<SurrogateAlgorithm> parse_algorithm(std::string_view s) noexcept {
    if (s == "FT")   return SurrogateAlgorithm::FT;
    if (s == "AAFT") return SurrogateAlgorithm::AAFT;
    return std::nullopt;
}

std::string_view to_string(SurrogateAlgorithm a) noexcept {
    switch (a) {
        case SurrogateAlgorithm::FT:   return "FT";
        case SurrogateAlgorithm::AAFT: return "AAFT";
    }
    return "?";
}

// ─── parse_date ───────────────────────────────────────────────────────────────

std::optional<Date> parse_date(std::string_view s) noexcept {
    s = trim(s);
    // YYYY-MM or YYYY-MM-DD
    if (s.size() != 7 && s.size() != 10) return std::nullopt;
    if (s[4] != '-') return std::nullopt;
    if (s.size() == 10 && s[7] != '-') return std::nullopt;

    const auto year  = parse_number<int>(s.substr(0, 4));
    const auto month = parse_number<int>(s.substr(5, 2));
    if (!year || !month || *month < 1 || *month > 12) return std::nullopt;

    int day = 1;
    if (s.size() == 10) {
        const auto d = parse_number<int>(s.substr(8, 2));
        if (!d || *d < 1 || *d > 31) return std::nullopt;
        day = *d;
    }
    return Date{*year, *month, day};
}

// ─── RunConfig ────────────────────────────────────────────────────────────────

std::optional<std::string> RunConfig::validate() const {
    if (scales.first < 1) {
        return fmt::format("scales.first must be >= 1 (got {})", scales.first);
    }
    if (scales.step < 1) {
        return fmt::format("scales.step must be >= 1 (got {})", scales.step);
    }
    if (scales.last < scales.first) {
        return fmt::format("scales.last ({}) must not be below scales.first ({})",
                           scales.last, scales.first);
    }
    if (estimators.eqq_bins < 2) {
        return fmt::format("estimators.eqq_bins must be >= 2 (got {})", estimators.eqq_bins);
    }
    if (estimators.knn_k < 1) {
        return fmt::format("estimators.knn_k must be >= 1 (got {})", estimators.knn_k);
    }
    if (estimators.max_lag < 2) {
        return fmt::format("estimators.max_lag must be >= 2, lag range [1, max_lag) is empty "
                           "(got {})", estimators.max_lag);
    }
    if (estimators.edge_trim < 0) {
        return fmt::format("estimators.edge_trim must be >= 0 (got {})", estimators.edge_trim);
    }
    if (surrogates.workers == 0) {
        return std::string("surrogates.workers must be >= 1");
    }
    if (surrogates.timeout.count() < 0) {
        return std::string("surrogates.timeout_s must be >= 0");
    }
    if (output.prefix.empty()) {
        return std::string("output.prefix must not be empty");
    }
    if (data.region && data.layout != DataLayout::Gridded) {
        return std::string("data.region requires data.layout = gridded");
    }
    return std::nullopt;
}

std::optional<ScaleGrid> RunConfig::scale_grid() const noexcept {
    return ScaleGrid::make(scales.first, scales.last, scales.step);
}

// ─── IniConfig ────────────────────────────────────────────────────────────────

IniConfig IniConfig::from_file(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw ConfigError("cannot open config file: " + file.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return from_string(ss.str(), file.string());
}

IniConfig IniConfig::from_string(std::string_view text, std::string source) {
    IniConfig cfg(std::move(source));
    cfg.parse(text);
    return cfg;
}

void IniConfig::parse(std::string_view text) {
    std::string section;
    std::size_t line_no = 0;
    std::size_t pos = 0;

    while (pos <= text.size()) {
        const auto eol = text.find('\n', pos);
        const auto raw = text.substr(pos, eol == std::string_view::npos ? text.size() - pos
                                                                        : eol - pos);
        pos = (eol == std::string_view::npos) ? text.size() + 1 : eol + 1;
        ++line_no;

        auto line = trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 3) {
                throw ConfigError(fmt::format("{}:{}: malformed section header", source_, line_no));
            }
            section = std::string(trim(line.substr(1, line.size() - 2)));
            data_[section];
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            throw ConfigError(fmt::format("{}:{}: expected 'key = value'", source_, line_no));
        }
        if (section.empty()) {
            throw ConfigError(fmt::format("{}:{}: key outside of a section", source_, line_no));
        }

        auto key   = trim(line.substr(0, eq));
        auto value = trim(line.substr(eq + 1));

        // Inline comments after the value.
        const auto hash = value.find_first_of("#;");
        if (hash != std::string_view::npos) value = trim(value.substr(0, hash));

        if (key.empty()) {
            throw ConfigError(fmt::format("{}:{}: empty key", source_, line_no));
        }
        data_[section][std::string(key)] = std::string(strip_quotes(value));
    }
}

bool IniConfig::has_key(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    return it != data_.end() && it->second.count(key) > 0;
}

std::optional<std::string>
IniConfig::get(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    if (it == data_.end()) return std::nullopt;
    auto kv = it->second.find(key);
    if (kv == it->second.end()) return std::nullopt;
    return kv->second;
}

RunConfig IniConfig::apply(RunConfig cfg) const {
    static const std::unordered_map<std::string, std::vector<std::string>> known{
        {"data",       {"path", "layout", "region", "first_date"}},
        {"scales",     {"first", "last", "step"}},
        {"estimators", {"eqq_bins", "knn_k", "max_lag", "edge_trim", "kd_tree"}},
        {"surrogates", {"count", "workers", "algorithm", "seed", "timeout_s"}},
        {"output",     {"prefix"}},
    };

    for (const auto& [section, keys] : data_) {
        auto sec = known.find(section);
        if (sec == known.end()) {
            throw ConfigError(fmt::format("{}: unknown section [{}]", source_, section));
        }
        for (const auto& [key, _] : keys) {
            if (std::find(sec->second.begin(), sec->second.end(), key) == sec->second.end()) {
                throw ConfigError(fmt::format("{}: unknown key '{}' in [{}]", source_, key, section));
            }
        }
    }

    auto fail = [this](const std::string& section, const std::string& key,
                       const std::string& value) -> ConfigError {
        return ConfigError(fmt::format("{}: invalid value for {}.{}: '{}'",
                                       source_, section, key, value));
    };

    auto set_int = [&](const std::string& section, const std::string& key, int& out) {
        if (auto v = get(section, key)) {
            auto n = parse_number<int>(*v);
            if (!n) throw fail(section, key, *v);
            out = *n;
        }
    };
    auto set_size = [&](const std::string& section, const std::string& key, std::size_t& out) {
        if (auto v = get(section, key)) {
            auto n = parse_number<std::size_t>(*v);
            if (!n) throw fail(section, key, *v);
            out = *n;
        }
    };

    // [data]
    if (auto v = get("data", "path")) cfg.data.path = *v;
    if (auto v = get("data", "layout")) {
        auto layout = parse_layout(to_lower(*v));
        if (!layout) throw fail("data", "layout", *v);
        cfg.data.layout = *layout;
    }
    if (auto v = get("data", "region")) {
        cfg.data.region = v->empty() ? std::nullopt : std::optional<std::string>(*v);
    }
    if (auto v = get("data", "first_date")) {
        auto d = parse_date(*v);
        if (!d) throw fail("data", "first_date", *v);
        cfg.data.first_date = *d;
    }

    // [scales]
    set_int("scales", "first", cfg.scales.first);
    set_int("scales", "last",  cfg.scales.last);
    set_int("scales", "step",  cfg.scales.step);

    // [estimators]
    set_int("estimators", "eqq_bins",  cfg.estimators.eqq_bins);
    set_int("estimators", "knn_k",     cfg.estimators.knn_k);
    set_int("estimators", "max_lag",   cfg.estimators.max_lag);
    set_int("estimators", "edge_trim", cfg.estimators.edge_trim);
    if (auto v = get("estimators", "kd_tree")) {
        auto b = parse_bool(*v);
        if (!b) throw fail("estimators", "kd_tree", *v);
        cfg.estimators.kd_tree = *b;
    }

    // [surrogates]
    set_size("surrogates", "count",   cfg.surrogates.count);
    set_size("surrogates", "workers", cfg.surrogates.workers);
    if (auto v = get("surrogates", "algorithm")) {
        std::string upper(*v);
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        auto algo = parse_algorithm(upper);
        if (!algo) throw fail("surrogates", "algorithm", *v);
        cfg.surrogates.algorithm = *algo;
    }
    if (auto v = get("surrogates", "seed")) {
        auto n = parse_number<unsigned long long>(*v);
        if (!n) throw fail("surrogates", "seed", *v);
        cfg.surrogates.seed = *n;
    }
    if (auto v = get("surrogates", "timeout_s")) {
        auto n = parse_number<long long>(*v);
        if (!n || *n < 0) throw fail("surrogates", "timeout_s", *v);
        cfg.surrogates.timeout = std::chrono::seconds(*n);
    }

    // [output]
    if (auto v = get("output", "prefix")) cfg.output.prefix = *v;

    return cfg;
}

} // namespace cmimap
