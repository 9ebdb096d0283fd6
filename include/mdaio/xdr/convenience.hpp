#pragma once

// One-shot helpers: encode a single value, or decode the first value of a buffer.

#include <string>
#include <string_view>
#include <utility>

#include "packer.hpp"
#include "unpacker.hpp"

namespace mdaio::xdr {

template <Integer T>
auto pack_uint(T x) -> bytes_t {
    auto p = packer{};
    p.pack_uint(x);
    return p.get_buffer();
}

template <Integer T>
auto pack_int(T x) -> bytes_t {
    auto p = packer{};
    p.pack_int(x);
    return p.get_buffer();
}

template <Integer T>
auto pack_hyper(T x) -> bytes_t {
    auto p = packer{};
    p.pack_hyper(x);
    return p.get_buffer();
}

template <Number T>
auto pack_float(T x) -> bytes_t {
    auto p = packer{};
    p.pack_float(x);
    return p.get_buffer();
}

template <Number T>
auto pack_double(T x) -> bytes_t {
    auto p = packer{};
    p.pack_double(x);
    return p.get_buffer();
}

inline auto pack_string(std::string_view s) -> bytes_t {
    auto p = packer{};
    p.pack_string(s);
    return p.get_buffer();
}

// Trailing bytes after the first value are ignored

inline auto unpack_uint(bytes_t data) -> std::uint32_t {
    return unpacker{std::move(data)}.unpack_uint();
}

inline auto unpack_int(bytes_t data) -> std::int32_t {
    return unpacker{std::move(data)}.unpack_int();
}

inline auto unpack_hyper(bytes_t data) -> std::int64_t {
    return unpacker{std::move(data)}.unpack_hyper();
}

inline auto unpack_float(bytes_t data) -> float {
    return unpacker{std::move(data)}.unpack_float();
}

inline auto unpack_double(bytes_t data) -> double {
    return unpacker{std::move(data)}.unpack_double();
}

inline auto unpack_string(bytes_t data) -> std::string {
    return unpacker{std::move(data)}.unpack_string();
}

} // namespace mdaio::xdr
