/*
 * File: map/char_sequence_map.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <format>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "recall/core/bytes.hpp"
#include "recall/core/debug.hpp"
#include "recall/buffer/concepts.hpp"
#include "recall/buffer/heap_buffer.hpp"
#include "recall/map/hash.hpp"

namespace recall::map {

	struct settings {
		std::size_t max_key_length = 16;
		std::size_t initial_size = 16;
		std::int64_t missing_value = -1;
		float load_factor = 0.7f;
	};

	/*
	 * Open addressing map from code unit sequences to 64-bit ids. All
	 * entries live in one buffer of bucket_count() equal buckets:
	 *
	 * bucket: [present:u32][length:u32][unit:u32 x max_key_length][id:i64]
	 *
	 * Collisions are resolved by linear probing with wraparound. There is
	 * no erase, so a probe run never contains holes and search may stop at
	 * the first empty bucket.
	 */
	template <CodeUnit CharT = char,
		Hasher<CharT> HashT = polynomial_hash<CharT>,
		buffer::concepts::ByteBuffer BufferT = buffer::heap_buffer>
	class char_sequence_map {
	public:

		using char_type = CharT;
		using key_view = std::basic_string_view<char_type>;
		using id_type = std::int64_t;
		using hash_type = HashT;
		using buffer_type = BufferT;

		constexpr static std::size_t present_offset = 0;
		constexpr static std::size_t length_offset = present_offset + sizeof(std::uint32_t);
		constexpr static std::size_t units_offset = length_offset + sizeof(std::uint32_t);
		constexpr static std::size_t unit_size = sizeof(std::uint32_t);

		char_sequence_map(std::size_t max_key_length, std::size_t initial_size,
			id_type missing_value, hash_type hash = {})
			: char_sequence_map(settings{
				.max_key_length = max_key_length,
				.initial_size = initial_size,
				.missing_value = missing_value,
			}, std::move(hash))
		{}

		explicit char_sequence_map(const settings& conf, hash_type hash = {})
			: hash_(std::move(hash))
			, max_key_length_(conf.max_key_length)
			, missing_value_(conf.missing_value)
			, load_factor_(checked_load_factor(conf.load_factor))
			, entry_size_(units_offset + unit_size * conf.max_key_length + sizeof(id_type))
			, buffer_(entry_size_ * core::next_power_of_two(conf.initial_size))
		{
			set_bucket_count(core::next_power_of_two(conf.initial_size));
			scratch_.reserve(max_key_length_);
		}

		char_sequence_map(char_sequence_map&&) = default;
		char_sequence_map& operator = (char_sequence_map&&) = default;
		char_sequence_map(const char_sequence_map&) = delete;
		char_sequence_map& operator = (const char_sequence_map&) = delete;

		// Inserting a key that is already present replaces its id.
		void insert(key_view key, id_type id) {
			if (key.size() > max_key_length_) {
				throw std::length_error(std::format("key of {} units exceeds max_key_length {}",
					key.size(), max_key_length_));
			}
			if (live_count_ > rehash_threshold_) {
				rehash();
			}
			put(key, id);
		}

		id_type search(key_view key) const {
			if (const auto bucket = find_bucket(key)) {
				return read_id(*bucket);
			}
			return missing_value_;
		}

		template <std::invocable<id_type> ConsumerT>
		bool search(key_view key, ConsumerT&& consumer) const {
			if (const auto bucket = find_bucket(key)) {
				std::forward<ConsumerT>(consumer)(read_id(*bucket));
				return true;
			}
			return false;
		}

		bool contains(key_view key) const {
			return find_bucket(key).has_value();
		}

		std::size_t size() const noexcept {
			return live_count_;
		}

		std::size_t bucket_count() const noexcept {
			return bucket_count_;
		}

		std::size_t max_key_length() const noexcept {
			return max_key_length_;
		}

		id_type missing_value() const noexcept {
			return missing_value_;
		}

		float load_factor() const noexcept {
			return load_factor_;
		}

		std::size_t entry_size() const noexcept {
			return entry_size_;
		}

		const buffer_type& buffer() const noexcept {
			return buffer_;
		}

		std::ostream& debug_print(std::ostream& os) const {
			os << std::format("char_sequence_map entries={} buckets={} rehash_at={} entry_size={}\n",
				live_count_, bucket_count_, rehash_threshold_, entry_size_);
			for (std::size_t bucket = 0; bucket < bucket_count_; ++bucket) {
				if (!is_present(buffer_, bucket)) {
					continue;
				}
				const auto length = read_length(buffer_, bucket);
				if constexpr (std::same_as<char_type, char>) {
					std::string key;
					for (std::size_t i = 0; i < length; ++i) {
						key.push_back(static_cast<char>(read_unit(buffer_, bucket, i)));
					}
					os << std::format("  [{}] '{}' -> {}\n", bucket, key, read_id(bucket));
				}
				else {
					os << std::format("  [{}] len:{} -> {}\n", bucket, length, read_id(bucket));
				}
			}
			return os;
		}

	PRIVATE_TESTABLE:

		std::size_t home_of(key_view key) const {
			return static_cast<std::size_t>(static_cast<std::uint32_t>(hash_(key))) & mask_;
		}

		// Circular probe over the byte span of the table, one entry per step.
		void put(key_view key, id_type id) {
			const std::size_t table_span = bucket_count_ * entry_size_;
			const std::size_t home = home_of(key) * entry_size_;

			for (std::size_t i = 0; i < bucket_count_; ++i) {
				std::size_t candidate = home + (i * entry_size_);
				if (candidate >= table_span) {
					candidate -= table_span;
				}
				const std::size_t bucket = candidate / entry_size_;
				if (!is_present(buffer_, bucket)) {
					write_entry(bucket, key, id);
					++live_count_;
					return;
				}
				if (holds_key(bucket, key)) {
					write_id(bucket, id);
					return;
				}
			}

			// Only reachable when the load factor allows a full table.
			rehash();
			put(key, id);
		}

		// Walks forward from the home bucket until an empty bucket.
		std::optional<std::size_t> find_bucket(key_view key) const {
			if (key.size() > max_key_length_) {
				return std::nullopt;
			}
			std::size_t bucket = home_of(key);
			for (std::size_t examined = 0; examined < bucket_count_; ++examined) {
				if (!is_present(buffer_, bucket)) {
					break;
				}
				if (holds_key(bucket, key)) {
					return { bucket };
				}
				bucket = (bucket + 1) & mask_;
			}
			return std::nullopt;
		}

		void rehash() {
			const std::size_t old_count = bucket_count_;
			buffer_type old(entry_size_ * old_count * 2);
			std::swap(old, buffer_);

			set_bucket_count(old_count * 2);
			live_count_ = 0;

			for (std::size_t bucket = 0; bucket < old_count; ++bucket) {
				if (!is_present(old, bucket)) {
					continue;
				}
				const auto length = read_length(old, bucket);
				scratch_.clear();
				for (std::size_t i = 0; i < length; ++i) {
					scratch_.push_back(static_cast<char_type>(read_unit(old, bucket, i)));
				}
				const auto id = old.read_i64(id_offset(bucket));
				put(key_view{ scratch_ }, id);
			}
		}

		void set_bucket_count(std::size_t count) {
			RECALL_ASSERT(core::is_power_of_two(count), "bucket count must be a power of two");
			bucket_count_ = count;
			mask_ = count - 1;
			rehash_threshold_ = static_cast<std::size_t>(load_factor_ * static_cast<float>(count));
		}

		bool holds_key(std::size_t bucket, key_view key) const {
			if (read_length(buffer_, bucket) != key.size()) {
				return false;
			}
			for (std::size_t i = 0; i < key.size(); ++i) {
				if (read_unit(buffer_, bucket, i) != code_unit_value(key[i])) {
					return false;
				}
			}
			return true;
		}

		void write_entry(std::size_t bucket, key_view key, id_type id) {
			const std::size_t base = bucket * entry_size_;
			buffer_.write_u32(base + length_offset, static_cast<std::uint32_t>(key.size()));
			for (std::size_t i = 0; i < key.size(); ++i) {
				buffer_.write_u32(base + units_offset + i * unit_size, code_unit_value(key[i]));
			}
			write_id(bucket, id);
			buffer_.write_u32(base + present_offset, 1);
		}

		void write_id(std::size_t bucket, id_type id) {
			buffer_.write_i64(id_offset(bucket), id);
		}

		id_type read_id(std::size_t bucket) const {
			return buffer_.read_i64(id_offset(bucket));
		}

		std::size_t id_offset(std::size_t bucket) const noexcept {
			return bucket * entry_size_ + units_offset + unit_size * max_key_length_;
		}

		bool is_present(const buffer_type& buf, std::size_t bucket) const {
			return buf.read_u32(bucket * entry_size_ + present_offset) != 0;
		}

		std::size_t read_length(const buffer_type& buf, std::size_t bucket) const {
			return buf.read_u32(bucket * entry_size_ + length_offset);
		}

		std::uint32_t read_unit(const buffer_type& buf, std::size_t bucket, std::size_t pos) const {
			return buf.read_u32(bucket * entry_size_ + units_offset + pos * unit_size);
		}

		static float checked_load_factor(float load_factor) {
			if (!(load_factor > 0.0f && load_factor <= 1.0f)) {
				throw std::invalid_argument(std::format("load_factor must be in (0, 1], got {}", load_factor));
			}
			return load_factor;
		}

		hash_type hash_;
		std::size_t max_key_length_ = 0;
		id_type missing_value_ = -1;
		float load_factor_ = 0.7f;
		std::size_t entry_size_ = 0;
		buffer_type buffer_;
		std::size_t bucket_count_ = 0;
		std::size_t mask_ = 0;
		std::size_t live_count_ = 0;
		std::size_t rehash_threshold_ = 0;
		std::basic_string<char_type> scratch_;
	};

} // namespace recall::map
