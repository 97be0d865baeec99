/*
 * File: buffer/concepts.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <concepts>
#include "recall/core/bytes.hpp"

namespace recall::buffer::concepts {

    // Typed access over a fixed-size, zero-filled byte region.
    template <class B>
    concept ByteBuffer = std::constructible_from<B, std::size_t> && requires(
        B buf,
        const B cbuf,
        std::size_t off,
        std::int64_t i64,
        std::uint32_t u32,
        std::uint8_t u8
    ) {
        { cbuf.capacity() } -> std::convertible_to<std::size_t>;

        { cbuf.read_i64(off) } -> std::same_as<std::int64_t>;
        { buf.write_i64(off, i64) } -> std::same_as<void>;

        { cbuf.read_u32(off) } -> std::same_as<std::uint32_t>;
        { buf.write_u32(off, u32) } -> std::same_as<void>;

        { cbuf.read_byte(off) } -> std::same_as<std::uint8_t>;
        { buf.write_byte(off, u8) } -> std::same_as<void>;

        { buf.data() } -> std::convertible_to<core::byte_span>;
        { cbuf.data() } -> std::convertible_to<core::byte_view>;
    };

} // namespace recall::buffer::concepts
