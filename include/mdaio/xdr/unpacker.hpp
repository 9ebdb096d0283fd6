#pragma once

// XDR unpacker: decodes values from a byte buffer through a read cursor.

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "error.hpp"
#include "format.hpp"

namespace mdaio::xdr {

// ============================================================================
// unpacker - sequential XDR decoder
// ============================================================================
//
// Reads must be issued in the order the values were packed; the stream
// carries no type tags. Bounds are checked before the cursor moves, so a
// failed read leaves the position unchanged. Padding after variable-length
// data is skipped without inspecting its content.
//
// ============================================================================

class unpacker {
public:
    explicit unpacker(bytes_t data) : data_(std::move(data)) {}

    void reset(bytes_t data) {
        data_ = std::move(data);
        position_ = 0;
    }

    // --- Cursor ---

    auto get_position() const -> std::size_t { return position_; }

    void set_position(std::int64_t position) {
        if (position < 0 || static_cast<std::uint64_t>(position) > data_.size()) {
            throw position_error();
        }
        position_ = static_cast<std::size_t>(position);
    }

    auto size() const -> std::size_t { return data_.size(); }
    auto remaining() const -> std::size_t { return data_.size() - position_; }

    // Unread remainder of the buffer
    auto get_buffer() const -> bytes_t {
        return bytes_t(data_.begin() + static_cast<std::ptrdiff_t>(position_), data_.end());
    }

    void done() const {
        if (position_ < data_.size()) {
            throw incomplete_error();
        }
    }

    // --- Integers ---

    auto unpack_uint() -> std::uint32_t {
        require(wire::UINT_SIZE);
        auto v = big_endian::get_u32(cursor());
        position_ += wire::UINT_SIZE;
        return v;
    }

    auto unpack_int() -> std::int32_t {
        require(wire::INT_SIZE);
        auto v = static_cast<std::int32_t>(big_endian::get_u32(cursor()));
        position_ += wire::INT_SIZE;
        return v;
    }

    auto unpack_hyper() -> std::int64_t {
        require(wire::HYPER_SIZE);
        auto v = static_cast<std::int64_t>(big_endian::get_u64(cursor()));
        position_ += wire::HYPER_SIZE;
        return v;
    }

    // --- Floating point ---

    auto unpack_float() -> float {
        require(wire::FLOAT_SIZE);
        auto v = big_endian::get_f32(cursor());
        position_ += wire::FLOAT_SIZE;
        return v;
    }

    auto unpack_double() -> double {
        require(wire::DOUBLE_SIZE);
        auto v = big_endian::get_f64(cursor());
        position_ += wire::DOUBLE_SIZE;
        return v;
    }

    // --- Fixed length ---

    auto unpack_fstring(std::size_t n) -> std::string {
        require(n);
        auto first = reinterpret_cast<const char*>(cursor());
        auto value = std::string(first, first + n);
        position_ += n;
        return value;
    }

    auto unpack_fopaque(std::size_t n) -> bytes_t {
        require(n);
        auto value = bytes_t(cursor(), cursor() + n);
        position_ += n;
        return value;
    }

    // --- Variable length ---

    // The payload and its padding must both be present: a string cut off
    // inside its padding is insufficient data, so the cursor never passes
    // the end of the buffer. Padding content is not inspected.
    auto unpack_string() -> std::string {
        auto n = counted_length();
        auto first = reinterpret_cast<const char*>(cursor() + wire::UINT_SIZE);
        auto value = std::string(first, first + n);
        position_ += wire::UINT_SIZE + n + wire::padding(n);
        return value;
    }

    auto unpack_opaque() -> bytes_t {
        auto n = counted_length();
        auto first = cursor() + wire::UINT_SIZE;
        auto value = bytes_t(first, first + n);
        position_ += wire::UINT_SIZE + n + wire::padding(n);
        return value;
    }

    auto unpack_bytes() -> bytes_t { return unpack_opaque(); }

    // --- Composites ---

    // uint count, then unpack_item(*this) that many times. On failure the
    // cursor returns to where the list began.
    template <typename F>
    auto unpack_list(F&& unpack_item) {
        using value_t = std::remove_cvref_t<std::invoke_result_t<F&, unpacker&>>;
        auto mark = position_;
        auto result = std::vector<value_t>{};
        try {
            auto count = unpack_uint();
            result.reserve(std::min<std::size_t>(count, remaining()));
            for (std::uint32_t i = 0; i < count; ++i) {
                result.push_back(std::invoke(unpack_item, *this));
            }
        } catch (...) {
            position_ = mark;
            throw;
        }
        return result;
    }

    // n elements with no count prefix
    template <typename F>
    auto unpack_array(F&& unpack_item, std::size_t n) {
        using value_t = std::remove_cvref_t<std::invoke_result_t<F&, unpacker&>>;
        auto mark = position_;
        auto result = std::vector<value_t>{};
        result.reserve(std::min(n, remaining()));
        try {
            for (std::size_t i = 0; i < n; ++i) {
                result.push_back(std::invoke(unpack_item, *this));
            }
        } catch (...) {
            position_ = mark;
            throw;
        }
        return result;
    }

private:
    bytes_t data_;
    std::size_t position_ = 0;

    auto cursor() const -> const std::uint8_t* { return data_.data() + position_; }

    void require(std::size_t width) const {
        if (width > remaining()) {
            throw insufficient_data_error();
        }
    }

    // Validates a length-prefixed payload and its padding without moving
    // the cursor; returns the payload length.
    auto counted_length() const -> std::size_t {
        require(wire::UINT_SIZE);
        auto n = static_cast<std::size_t>(big_endian::get_u32(cursor()));
        auto available = remaining() - wire::UINT_SIZE;
        if (n > available || wire::padding(n) > available - n) {
            throw insufficient_data_error();
        }
        return n;
    }
};

} // namespace mdaio::xdr
