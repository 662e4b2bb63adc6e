#pragma once

/// @file include/cmimap/archive.hpp
/// @brief Named n-dimensional arrays and their binary archive format.
///
/// # Format (little-endian)
/// ```
/// magic  "CMIMAP01"                          8 bytes
/// u32    key count
/// per key:
///   u32 name length, name bytes
///   u32 rank, u64 dims[rank]
///   u64 count, f64 data[count]               row-major (C order)
/// ```
///
/// Writes go to `<path>.tmp` and are renamed over the target, so a reader
/// never observes a half-written archive.

#include <cstddef>
#include <filesystem>
#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace cmimap {

/// Dense row-major array. Rank 0 = scalar (one element).
struct NdArray {
    std::vector<std::size_t> shape;
    std::vector<double>      data;

    [[nodiscard]] std::size_t rank() const noexcept { return shape.size(); }

    /// Product of dims (1 for rank 0).
    [[nodiscard]] std::size_t element_count() const noexcept;

    /// True if data.size() matches the shape.
    [[nodiscard]] bool is_consistent() const noexcept;

    [[nodiscard]] double at(std::size_t i, std::size_t j) const;
    [[nodiscard]] double at(std::size_t i, std::size_t j, std::size_t k) const;

    friend bool operator==(const NdArray&, const NdArray&) = default;
};

using ArrayMap = std::map<std::string, NdArray>;

namespace archive {

inline constexpr char MAGIC[] = "CMIMAP01";
inline constexpr std::size_t MAGIC_SIZE = 8;

/// Serialize to a stream. Throws `IoError` on stream failure or an
/// inconsistent array.
void write(std::ostream& os, const ArrayMap& arrays);

/// Parse from a stream. Throws `IoError` on bad magic, truncation or
/// shape/count mismatch.
[[nodiscard]] ArrayMap read(std::istream& is);

/// Atomic file write (temp file + rename).
void save(const std::filesystem::path& path, const ArrayMap& arrays);

[[nodiscard]] ArrayMap load(const std::filesystem::path& path);

} // namespace archive

} // namespace cmimap
