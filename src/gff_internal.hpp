#pragma once

#include "gff/gff.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace gff::internal {

// ------------------------------
// Endian helpers
// ------------------------------

inline std::uint32_t load_u32_le(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0])      ) |
           (static_cast<std::uint32_t>(p[1]) <<  8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

inline void store_u32_le(std::uint8_t* p, std::uint32_t v) {
    p[0] = static_cast<std::uint8_t>(v & 0xFFu);
    p[1] = static_cast<std::uint8_t>((v >> 8) & 0xFFu);
    p[2] = static_cast<std::uint8_t>((v >> 16) & 0xFFu);
    p[3] = static_cast<std::uint8_t>((v >> 24) & 0xFFu);
}

inline std::uint32_t float_bits(float f) {
    std::uint32_t u = 0;
    std::memcpy(&u, &f, sizeof(u));
    return u;
}

inline float float_from_bits(std::uint32_t u) {
    float f = 0.0f;
    std::memcpy(&f, &u, sizeof(f));
    return f;
}

inline std::uint64_t double_bits(double d) {
    std::uint64_t u = 0;
    std::memcpy(&u, &d, sizeof(u));
    return u;
}

inline double double_from_bits(std::uint64_t u) {
    double d = 0.0;
    std::memcpy(&d, &u, sizeof(d));
    return d;
}

/// `offset + len <= size` without overflow.
inline bool fits(std::uint64_t offset, std::uint64_t len, std::uint64_t size) {
    return offset <= size && len <= size - offset;
}

// ------------------------------
// Byte cursor
// ------------------------------

/// Bounds-checked little-endian reader over one region of a buffer. Reads
/// past the end throw Truncated, seeks past the end throw OffsetRange; both
/// name the region the cursor was opened on.
class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t size, GffRegion region)
        : data_(data), size_(size), region_(region) {}

    std::size_t size() const noexcept { return size_; }
    std::size_t position() const noexcept { return pos_; }
    std::size_t remaining() const noexcept { return size_ - pos_; }
    GffRegion region() const noexcept { return region_; }

    void seek(std::size_t pos) {
        if (pos > size_) {
            throw GffError(ErrorKind::OffsetRange,
                           "offset " + std::to_string(pos) + " is outside the " + to_string(region_) +
                           " region (" + std::to_string(size_) + " bytes)",
                           region_);
        }
        pos_ = pos;
    }

    /// Sub-reader over the next `n` bytes; advances past them.
    ByteReader sub(std::size_t n) {
        require(n);
        ByteReader r(data_ + pos_, n, region_);
        pos_ += n;
        return r;
    }

    std::uint8_t u8() {
        require(1);
        return data_[pos_++];
    }

    std::uint16_t u16() {
        require(2);
        std::uint16_t v = static_cast<std::uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return v;
    }

    std::uint32_t u32() {
        require(4);
        std::uint32_t v = load_u32_le(data_ + pos_);
        pos_ += 4;
        return v;
    }

    std::int32_t i32() { return static_cast<std::int32_t>(u32()); }

    std::uint64_t u64() {
        std::uint64_t lo = u32();
        std::uint64_t hi = u32();
        return lo | (hi << 32);
    }

    std::int64_t i64() { return static_cast<std::int64_t>(u64()); }

    float f32() { return float_from_bits(u32()); }

    double f64() { return double_from_bits(u64()); }

    std::string str(std::size_t n) {
        require(n);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

    std::vector<std::uint8_t> bytes(std::size_t n) {
        require(n);
        std::vector<std::uint8_t> b(data_ + pos_, data_ + pos_ + n);
        pos_ += n;
        return b;
    }

private:
    void require(std::size_t n) const {
        if (n > size_ - pos_) {
            throw GffError(ErrorKind::Truncated,
                           "need " + std::to_string(n) + " bytes at offset " + std::to_string(pos_) +
                           " of the " + to_string(region_) + " region (" + std::to_string(size_) + " bytes)",
                           region_);
        }
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_{0};
    GffRegion region_;
};

/// Appending little-endian writer; `patch_u32` fills reserved slots later.
class ByteWriter {
public:
    std::size_t size() const noexcept { return buf_.size(); }
    const std::vector<std::uint8_t>& data() const noexcept { return buf_; }

    void u8(std::uint8_t v) { buf_.push_back(v); }

    void u16(std::uint16_t v) {
        buf_.push_back(static_cast<std::uint8_t>(v & 0xFFu));
        buf_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    }

    void u32(std::uint32_t v) {
        std::uint8_t b[4];
        store_u32_le(b, v);
        buf_.insert(buf_.end(), b, b + 4);
    }

    void i32(std::int32_t v) { u32(static_cast<std::uint32_t>(v)); }

    void u64(std::uint64_t v) {
        u32(static_cast<std::uint32_t>(v & 0xFFFFFFFFu));
        u32(static_cast<std::uint32_t>(v >> 32));
    }

    void i64(std::int64_t v) { u64(static_cast<std::uint64_t>(v)); }

    void f32(float v) { u32(float_bits(v)); }

    void f64(double v) { u64(double_bits(v)); }

    void bytes(const void* p, std::size_t n) {
        const auto* b = static_cast<const std::uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }

    void zeros(std::size_t n) { buf_.insert(buf_.end(), n, std::uint8_t{0}); }

    void patch_u32(std::size_t pos, std::uint32_t v) { store_u32_le(buf_.data() + pos, v); }

    std::vector<std::uint8_t> take() { return std::move(buf_); }

private:
    std::vector<std::uint8_t> buf_{};
};

/// Narrow a region size or offset to the 32-bit wire width.
inline std::uint32_t to_u32(std::size_t v, GffRegion region) {
    if (v > (std::numeric_limits<std::uint32_t>::max)()) {
        throw GffError(ErrorKind::OffsetRange, "the " + to_string(region) + " region exceeds 4 GiB", region);
    }
    return static_cast<std::uint32_t>(v);
}

// ------------------------------
// Header codec helpers (gff_header.cpp)
// ------------------------------

/// Throws UnsupportedVersion unless `version` is "V3.2" (or "V3.3" when allowed).
void check_version(const std::string& version, bool allow_v33);

/// Throws Truncated naming the first region of `h` that does not fit in `size` bytes.
void check_regions(const Header& h, std::uint64_t size);

} // namespace gff::internal
