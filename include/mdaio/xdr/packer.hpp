#pragma once

// XDR packer: serializes primitive and composite values into a byte buffer.

#include <cmath>
#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "error.hpp"
#include "format.hpp"

namespace mdaio::xdr {

// Integer inputs: any integral type except bool and the character types
template <typename T>
concept Integer = std::integral<T> &&
    !std::same_as<std::remove_cv_t<T>, bool> &&
    !std::same_as<std::remove_cv_t<T>, char> &&
    !std::same_as<std::remove_cv_t<T>, wchar_t> &&
    !std::same_as<std::remove_cv_t<T>, char8_t> &&
    !std::same_as<std::remove_cv_t<T>, char16_t> &&
    !std::same_as<std::remove_cv_t<T>, char32_t>;

template <typename T>
concept Number = Integer<T> || std::floating_point<T>;

// ============================================================================
// packer - append-only XDR encoder
// ============================================================================
//
// Every pack_* call validates its input before touching the buffer, so a
// failed call leaves the buffer exactly as it was. pack_list and pack_array
// roll back any elements already appended when an element fails.
//
// ============================================================================

class packer {
public:
    packer() = default;

    void reset() { buffer_.clear(); }

    // Snapshot of the bytes written so far
    auto get_buffer() const -> bytes_t { return buffer_; }

    auto size() const -> std::size_t { return buffer_.size(); }

    // --- Integers ---

    template <Integer T>
    void pack_uint(T x) {
        if (!std::in_range<std::uint32_t>(x)) {
            throw conversion_error("uint must be 0 <= uint <= 2**32-1");
        }
        big_endian::put_u32(buffer_, static_cast<std::uint32_t>(x));
    }

    template <Integer T>
    void pack_int(T x) {
        if (!std::in_range<std::int32_t>(x)) {
            throw conversion_error("int must be -2**31 <= int <= 2**31-1");
        }
        big_endian::put_u32(buffer_, static_cast<std::uint32_t>(static_cast<std::int32_t>(x)));
    }

    template <Integer T>
    void pack_hyper(T x) {
        if (!std::in_range<std::int64_t>(x)) {
            throw conversion_error("hyper must be -2**63 <= hyper <= 2**63-1");
        }
        big_endian::put_u64(buffer_, static_cast<std::uint64_t>(static_cast<std::int64_t>(x)));
    }

    // --- Floating point ---

    template <Number T>
    void pack_float(T x) {
        check_magnitude<float>(x, "float too large to pack");
        big_endian::put_f32(buffer_, static_cast<float>(x));
    }

    template <Number T>
    void pack_double(T x) {
        check_magnitude<double>(x, "double too large to pack");
        big_endian::put_f64(buffer_, static_cast<double>(x));
    }

    // --- Fixed length ---

    void pack_fstring(std::size_t n, std::string_view s) {
        if (s.size() != n) {
            throw conversion_error("fstring length mismatch");
        }
        buffer_.insert(buffer_.end(), s.begin(), s.end());
    }

    void pack_fopaque(std::size_t n, std::span<const std::uint8_t> data) {
        if (data.size() != n) {
            throw conversion_error("fopaque length mismatch");
        }
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    // --- Variable length ---

    void pack_string(std::string_view s) {
        append_counted(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
    }

    void pack_opaque(std::span<const std::uint8_t> data) {
        append_counted(data.data(), data.size());
    }

    void pack_bytes(std::span<const std::uint8_t> data) { pack_opaque(data); }

    // --- Composites ---

    // uint count, then pack_item(*this, element) for each element
    template <std::ranges::sized_range R, typename F>
    void pack_list(const R& items, F&& pack_item) {
        auto count = std::ranges::size(items);
        if (!std::in_range<std::uint32_t>(count)) {
            throw conversion_error("list too long");
        }
        auto mark = buffer_.size();
        try {
            pack_uint(count);
            for (const auto& item : items) {
                std::invoke(pack_item, *this, item);
            }
        } catch (...) {
            buffer_.resize(mark);
            throw;
        }
    }

    // Elements only; the reader supplies the count
    template <std::ranges::input_range R, typename F>
    void pack_array(const R& items, F&& pack_item) {
        auto mark = buffer_.size();
        try {
            for (const auto& item : items) {
                std::invoke(pack_item, *this, item);
            }
        } catch (...) {
            buffer_.resize(mark);
            throw;
        }
    }

private:
    bytes_t buffer_;

    // Finite values beyond the target's range; checked in T before narrowing
    template <std::floating_point Target, Number T>
    static void check_magnitude(T x, const char* message) {
        if constexpr (std::floating_point<T>) {
            if (std::isfinite(x) && std::abs(x) > static_cast<T>(std::numeric_limits<Target>::max())) {
                throw conversion_error(message);
            }
        }
    }

    void append_counted(const std::uint8_t* data, std::size_t length) {
        if (!std::in_range<std::uint32_t>(length)) {
            throw conversion_error("variable-length data longer than 2**32-1 bytes");
        }
        big_endian::put_u32(buffer_, static_cast<std::uint32_t>(length));
        buffer_.insert(buffer_.end(), data, data + length);
        buffer_.insert(buffer_.end(), wire::padding(length), std::uint8_t{0});
    }
};

} // namespace mdaio::xdr
