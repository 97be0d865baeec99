/*
 * File: bytes.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */
#pragma once

#include <bit>
#include <cstdint>
#include <vector>
#include <span>
#include <concepts>

namespace recall::core {

    using byte = std::byte;
	using byte_buffer = std::vector<byte>;
	using byte_view = std::span<const byte>;
	using byte_span = std::span<byte>;

	template <typename T>
	constexpr inline T next_power_of_two(T value)
		requires std::unsigned_integral<T>
	{
		return (value <= 1) ? T{ 1 } : std::bit_ceil(value);
	}

	template <typename T>
	constexpr inline bool is_power_of_two(T value)
		requires std::unsigned_integral<T>
	{
		return std::has_single_bit(value);
	}

} // namespace recall::core
