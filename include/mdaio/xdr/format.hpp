#pragma once

// Wire format constants and big-endian byte helpers for the XDR codec.

#include <bit>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace mdaio::xdr {

using bytes_t = std::vector<std::uint8_t>;

// ============================================================================
// Wire format constants
// ============================================================================
//
// - Integers and floats: big-endian, IEEE-754 for floating point
// - uint / int / float:  4 bytes
// - hyper / double:      8 bytes
// - fstring / fopaque:   n raw bytes, no prefix, no padding
// - string / opaque:     uint length + bytes + zero padding to a multiple of 4
// - list:                uint count + elements
// - array:               elements only (count agreed out of band)
//
// ============================================================================

namespace wire {

constexpr std::size_t UNIT = 4;
constexpr std::size_t UINT_SIZE = 4;
constexpr std::size_t INT_SIZE = 4;
constexpr std::size_t HYPER_SIZE = 8;
constexpr std::size_t FLOAT_SIZE = 4;
constexpr std::size_t DOUBLE_SIZE = 8;

constexpr auto padding(std::size_t length) -> std::size_t {
    return (UNIT - length % UNIT) % UNIT;
}

} // namespace wire

// ============================================================================
// Big-endian helpers
// ============================================================================

namespace big_endian {

inline void put_u32(bytes_t& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 24));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

inline void put_u64(bytes_t& out, std::uint64_t v) {
    put_u32(out, static_cast<std::uint32_t>(v >> 32));
    put_u32(out, static_cast<std::uint32_t>(v));
}

inline auto get_u32(const std::uint8_t* p) -> std::uint32_t {
    return (std::uint32_t{p[0]} << 24) |
           (std::uint32_t{p[1]} << 16) |
           (std::uint32_t{p[2]} << 8) |
            std::uint32_t{p[3]};
}

inline auto get_u64(const std::uint8_t* p) -> std::uint64_t {
    return (std::uint64_t{get_u32(p)} << 32) | get_u32(p + 4);
}

static_assert(sizeof(float) == 4 && sizeof(double) == 8, "IEEE-754 float and double required");

inline void put_f32(bytes_t& out, float v) { put_u32(out, std::bit_cast<std::uint32_t>(v)); }
inline void put_f64(bytes_t& out, double v) { put_u64(out, std::bit_cast<std::uint64_t>(v)); }
inline auto get_f32(const std::uint8_t* p) -> float { return std::bit_cast<float>(get_u32(p)); }
inline auto get_f64(const std::uint8_t* p) -> double { return std::bit_cast<double>(get_u64(p)); }

} // namespace big_endian

} // namespace mdaio::xdr
