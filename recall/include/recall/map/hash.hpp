/*
 * File: map/hash.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace recall::map {

	template <typename CharT>
	concept CodeUnit = std::same_as<CharT, char> || std::same_as<CharT, char8_t>
		|| std::same_as<CharT, char16_t> || std::same_as<CharT, char32_t>
		|| std::same_as<CharT, wchar_t>;

	template <CodeUnit CharT>
	constexpr inline std::uint32_t code_unit_value(CharT c) noexcept {
		return static_cast<std::uint32_t>(static_cast<std::make_unsigned_t<CharT>>(c));
	}

	// h = 31 * h + unit, wrapping at 32 bits.
	template <CodeUnit CharT>
	struct polynomial_hash {
		constexpr std::uint32_t operator()(std::basic_string_view<CharT> key) const noexcept {
			std::uint32_t hash = 0;
			for (const auto c : key) {
				hash = (31u * hash) + code_unit_value(c);
			}
			return hash;
		}
	};

	template <typename HashT, typename CharT>
	concept Hasher = std::copy_constructible<HashT>
		&& std::invocable<const HashT&, std::basic_string_view<CharT>>
		&& std::convertible_to<std::invoke_result_t<const HashT&, std::basic_string_view<CharT>>, std::uint32_t>;

} // namespace recall::map
