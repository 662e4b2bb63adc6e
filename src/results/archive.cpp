/// @file src/results/archive.cpp
/// @brief Binary archive reader/writer for named arrays.

#include "cmimap/archive.hpp"
#include "cmimap/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <bit>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace cmimap {

// Integers and doubles are copied in host order; the format is little-endian.
static_assert(std::endian::native == std::endian::little,
              "archive I/O assumes a little-endian host");

// ─── NdArray ──────────────────────────────────────────────────────────────────

std::size_t NdArray::element_count() const noexcept {
    std::size_t n = 1;
    for (std::size_t d : shape) n *= d;
    return n;
}

bool NdArray::is_consistent() const noexcept {
    return data.size() == element_count();
}

double NdArray::at(std::size_t i, std::size_t j) const {
    if (rank() != 2 || i >= shape[0] || j >= shape[1]) {
        throw std::out_of_range("NdArray::at(i, j): index out of range or rank != 2");
    }
    return data[i * shape[1] + j];
}

double NdArray::at(std::size_t i, std::size_t j, std::size_t k) const {
    if (rank() != 3 || i >= shape[0] || j >= shape[1] || k >= shape[2]) {
        throw std::out_of_range("NdArray::at(i, j, k): index out of range or rank != 3");
    }
    return data[(i * shape[1] + j) * shape[2] + k];
}

namespace archive {

namespace {

/// Upper bounds for a well-formed archive; anything larger is corruption.
constexpr std::uint32_t MAX_KEYS      = 1u << 16;
constexpr std::uint32_t MAX_NAME      = 1u << 12;
constexpr std::uint32_t MAX_RANK      = 8;
constexpr std::size_t   READ_CHUNK    = 1u << 16;

class Writer {
public:
    explicit Writer(std::ostream& os) : os_(os) {
        if (!os_) throw IoError("archive: stream is not writable");
    }

    void bytes(const void* data, std::size_t n) {
        os_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
        if (!os_) throw IoError("archive: write failed");
    }

    template <typename T>
    void pod(const T& v) {
        static_assert(std::is_trivially_copyable_v<T>);
        bytes(&v, sizeof(T));
    }

    void u32(std::uint32_t v) { pod(v); }
    void u64(std::uint64_t v) { pod(v); }

    void string(std::string_view s) {
        if (s.size() > MAX_NAME) throw IoError(fmt::format("archive: key too long ({} bytes)", s.size()));
        u32(static_cast<std::uint32_t>(s.size()));
        if (!s.empty()) bytes(s.data(), s.size());
    }

private:
    std::ostream& os_;
};

class Reader {
public:
    explicit Reader(std::istream& is) : is_(is) {
        if (!is_) throw IoError("archive: stream is not readable");
    }

    void bytes(void* data, std::size_t n) {
        is_.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(n));
        if (!is_) throw IoError("archive: read failed (truncated or corrupt file?)");
    }

    template <typename T>
    T pod() {
        static_assert(std::is_trivially_copyable_v<T>);
        T v{};
        bytes(&v, sizeof(T));
        return v;
    }

    std::uint32_t u32() { return pod<std::uint32_t>(); }
    std::uint64_t u64() { return pod<std::uint64_t>(); }

    std::string string() {
        const std::uint32_t n = u32();
        if (n > MAX_NAME) throw IoError(fmt::format("archive: key length {} exceeds limit", n));
        std::string s(n, '\0');
        if (n > 0) bytes(s.data(), n);
        return s;
    }

    /// Read `count` doubles in bounded chunks so a corrupt count cannot force
    /// a huge allocation before truncation is detected.
    std::vector<double> doubles(std::uint64_t count) {
        std::vector<double> out;
        std::uint64_t remaining = count;
        while (remaining > 0) {
            const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, READ_CHUNK));
            const std::size_t offset = out.size();
            out.resize(offset + chunk);
            bytes(out.data() + offset, chunk * sizeof(double));
            remaining -= chunk;
        }
        return out;
    }

private:
    std::istream& is_;
};

void rename_over(const std::filesystem::path& tmp, const std::filesystem::path& target) {
    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (!ec) return;

    // Some filesystems refuse to rename over an existing file.
    std::filesystem::remove(target, ec);
    ec.clear();
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        throw IoError(fmt::format("archive: rename '{}' -> '{}' failed ({})",
                                  tmp.string(), target.string(), ec.message()));
    }
}

} // namespace

// ─── write / read ─────────────────────────────────────────────────────────────

void write(std::ostream& os, const ArrayMap& arrays) {
    Writer w(os);
    if (arrays.size() > MAX_KEYS) {
        throw IoError(fmt::format("archive: too many keys ({})", arrays.size()));
    }
    w.bytes(MAGIC, MAGIC_SIZE);
    w.u32(static_cast<std::uint32_t>(arrays.size()));

    for (const auto& [name, array] : arrays) {
        if (!array.is_consistent() || array.rank() > MAX_RANK) {
            throw IoError(fmt::format("archive: array '{}' has inconsistent shape", name));
        }
        w.string(name);
        w.u32(static_cast<std::uint32_t>(array.rank()));
        for (std::size_t d : array.shape) w.u64(d);
        w.u64(array.data.size());
        if (!array.data.empty()) w.bytes(array.data.data(), array.data.size() * sizeof(double));
    }
}

ArrayMap read(std::istream& is) {
    Reader r(is);

    char magic[MAGIC_SIZE];
    r.bytes(magic, MAGIC_SIZE);
    if (std::string_view(magic, MAGIC_SIZE) != std::string_view(MAGIC, MAGIC_SIZE)) {
        throw IoError("archive: magic mismatch (not a cmimap archive, or wrong version)");
    }

    const std::uint32_t keys = r.u32();
    if (keys > MAX_KEYS) throw IoError(fmt::format("archive: key count {} exceeds limit", keys));

    ArrayMap arrays;
    for (std::uint32_t k = 0; k < keys; ++k) {
        std::string name = r.string();

        const std::uint32_t rank = r.u32();
        if (rank > MAX_RANK) {
            throw IoError(fmt::format("archive: array '{}' has rank {} (limit {})", name, rank, MAX_RANK));
        }

        NdArray array;
        std::uint64_t expected = 1;
        for (std::uint32_t d = 0; d < rank; ++d) {
            const std::uint64_t dim = r.u64();
            if (dim != 0 && expected > std::numeric_limits<std::uint64_t>::max() / dim) {
                throw IoError(fmt::format("archive: array '{}' shape overflows", name));
            }
            expected *= dim;
            array.shape.push_back(static_cast<std::size_t>(dim));
        }

        const std::uint64_t count = r.u64();
        if (count != expected) {
            throw IoError(fmt::format("archive: array '{}' holds {} values, shape needs {}",
                                      name, count, expected));
        }
        array.data = r.doubles(count);

        if (!arrays.emplace(std::move(name), std::move(array)).second) {
            throw IoError("archive: duplicate key");
        }
    }
    return arrays;
}

// ─── save / load ──────────────────────────────────────────────────────────────

void save(const std::filesystem::path& path, const ArrayMap& arrays) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs) throw IoError("archive: cannot open temp file for writing: " + tmp.string());
        write(ofs, arrays);
        ofs.flush();
        if (!ofs) throw IoError("archive: failed while writing temp file: " + tmp.string());
    }
    rename_over(tmp, path);
}

ArrayMap load(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw IoError("archive: cannot open " + path.string());
    return read(ifs);
}

} // namespace archive

} // namespace cmimap
