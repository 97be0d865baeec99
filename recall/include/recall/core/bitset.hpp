/*
 * File: core/bitset.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <bit>
#include <climits>
#include <concepts>
#include <optional>

#include "recall/core/bytes.hpp"
#include "recall/core/types.hpp"
#include "recall/core/debug.hpp"

namespace recall::core {

	// Number of bytes needed to keep `bits` bits in 64-bit words.
	constexpr inline std::size_t bitset_bytes_for(std::size_t bits) noexcept {
		constexpr std::size_t bits_per_word = sizeof(std::uint64_t) * CHAR_BIT;
		return ((bits + bits_per_word - 1) / bits_per_word) * sizeof(std::uint64_t);
	}

	template <typename SpanT = core::byte_span>
		requires (std::same_as<SpanT, core::byte_view> || std::same_as<SpanT, core::byte_span>)
	class bitset {
	public:
		using data_type = core::word_u64;
		using word_type = typename data_type::word_type;

		constexpr static std::size_t data_bits = sizeof(data_type) * CHAR_BIT;
		using span_type = SpanT;

		using data_ptr = std::conditional_t<
			std::same_as<SpanT, core::byte_view>,
			const data_type *,
			data_type *
		>;

		using container_type = std::conditional_t<
			std::same_as<SpanT, core::byte_view>,
			std::span<const data_type>,
			std::span<data_type>
		>;

        bitset() = delete;

		bitset(bitset&&) = default;
		bitset& operator = (bitset&&) = default;
		bitset(const bitset&) = default;
		bitset& operator = (const bitset&) = default;

		bitset(span_type container, std::size_t maximum)
			: buckets_(reinterpret_cast<data_ptr>(container.data()), container.size() / sizeof(data_type))
			, maximum_(std::min(buckets_.size() * data_bits, maximum))
		{
			RECALL_ASSERT(container.size() % sizeof(data_type) == 0, "Something wrong with the length");
		}

		inline std::size_t bits_count() const noexcept {
			return maximum_;
		}

		inline void set(std::size_t bit_pos) {
			if (bits_count() <= bit_pos) {
				return;
			}
			const auto bucket = bit_pos / data_bits;
			const auto pos = bit_pos % data_bits;
			buckets_[bucket] = buckets_[bucket].get() | (word_type{1} << pos);
		}

		inline void clear(std::size_t bit_pos) {
			if (bits_count() <= bit_pos) {
				return;
			}
			const auto bucket = bit_pos / data_bits;
			const auto pos = bit_pos % data_bits;
			buckets_[bucket] = buckets_[bucket].get() & ~(word_type{1} << pos);
		}

		inline void reset() {
			for (std::size_t b = 0; b < buckets_.size(); ++b) {
				buckets_[b] = 0;
			}
		}

		[[nodiscard]]
		inline bool test(std::size_t bit_pos) const {
			if (bits_count() <= bit_pos) {
				return false;
			}
			const auto bucket = bit_pos / data_bits;
			const auto pos = bit_pos % data_bits;
			return (buckets_[bucket].get() & (word_type{1} << pos)) != 0;
		}

		// First set bit at or after `from`.
		std::optional<std::size_t> find_set_bit(std::size_t from = 0) const {
			if (from >= bits_count()) {
				return std::nullopt;
			}
			std::size_t b = from / data_bits;
			word_type bucket = buckets_[b].get() & (~word_type{0} << (from % data_bits));
			while (true) {
				if (bucket != 0) {
					const std::size_t bit_pos = b * data_bits + std::countr_zero(bucket);
					if (bit_pos < bits_count()) {
						return { bit_pos };
					}
					return std::nullopt;
				}
				if (++b >= buckets_.size()) {
					break;
				}
				bucket = buckets_[b].get();
			}
			return std::nullopt;
		}

		std::size_t popcount() const {
			std::size_t total = 0;
			for (std::size_t b = 0; b < buckets_.size(); ++b) {
				total += std::popcount(buckets_[b].get());
			}
			return total;
		}

	private:
		container_type buckets_ = {};
		std::size_t maximum_ = 0;
	};
} // namespace recall::core
