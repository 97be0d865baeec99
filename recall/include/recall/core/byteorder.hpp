/*
 * File: byteorder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <bit>
#include <cstring>
#include <limits>
#include <type_traits>

#include "recall/core/bytes.hpp"

// Every integer that lands in a recall buffer is little-endian.
namespace recall::core::byteorder {

	template <typename T>
	concept SignedWord = std::is_signed_v<T> && std::is_integral_v<T> &&
		((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept UnsignedWord = std::is_unsigned_v<T> && std::is_integral_v<T> &&
		((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept Word = SignedWord<T> || UnsignedWord<T>;

	template <UnsignedWord WordT>
	inline WordT le_to_native_unsigned(const core::byte* mem) {
		if constexpr (std::endian::native == std::endian::little) {
			WordT result;
			std::memcpy(&result, mem, sizeof(WordT));
			return result;
		}
		else {
			WordT result = 0;
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				result |= static_cast<WordT>(static_cast<WordT>(mem[i]) << (i * 8));
			}
			return result;
		}
	}

	template <UnsignedWord WordT>
	inline void native_to_le_unsigned(WordT val, core::byte* mem) {
		if constexpr (std::endian::native == std::endian::little) {
			std::memcpy(mem, &val, sizeof(WordT));
		}
		else {
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				mem[i] = static_cast<core::byte>((val >> (i * 8)) & 0xFF);
			}
		}
	}

	template <Word WordT>
	inline WordT le_to_native(const core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			return le_to_native_unsigned<WordT>(mem);
		}
		else {
			using unsigned_type = std::make_unsigned_t<WordT>;
			return std::bit_cast<WordT>(le_to_native_unsigned<unsigned_type>(mem));
		}
	}

	template <Word WordT>
	inline void native_to_le(WordT val, core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			native_to_le_unsigned<WordT>(val, mem);
		}
		else {
			using unsigned_type = std::make_unsigned_t<WordT>;
			native_to_le_unsigned<unsigned_type>(std::bit_cast<unsigned_type>(val), mem);
		}
	}

	template <Word WordT = std::uint32_t>
	class word_le {
	public:

		using word_type = WordT;

		word_le() = default;
		word_le(word_type val) {
			from_native(val);
		}
		word_le(word_le&&) = default;
		word_le& operator = (word_le&&) = default;
		word_le(const word_le&) = default;
		word_le& operator = (const word_le&) = default;

		operator word_type() const {
			return get();
		}

		word_le& operator = (word_type val) {
			from_native(val);
			return *this;
		}

		word_type get() const {
			return le_to_native<word_type>(&bytes_[0]);
		}

		constexpr static auto max() {
			return std::numeric_limits<word_type>::max();
		}

		constexpr static auto min() {
			return std::numeric_limits<word_type>::min();
		}

	private:

		void from_native(word_type val) {
			native_to_le<word_type>(val, &bytes_[0]);
		}

		core::byte bytes_[sizeof(word_type)];
	};

	static_assert(sizeof(word_le<std::uint64_t>) == sizeof(std::uint64_t));

} // namespace recall::core::byteorder
