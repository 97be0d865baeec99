/*
 * File: store/record_store.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <format>
#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "recall/core/bytes.hpp"
#include "recall/core/bitset.hpp"
#include "recall/core/debug.hpp"
#include "recall/core/errors.hpp"
#include "recall/buffer/concepts.hpp"
#include "recall/buffer/heap_buffer.hpp"
#include "recall/buffer/ops.hpp"
#include "recall/store/concepts.hpp"

namespace recall::store {

	enum class slot_state : std::uint8_t {
		empty = 0,
		live = 1,
		tombstone = 2,
	};

	/*
	 * Fixed capacity array of equal sized slots in one buffer.
	 *
	 * slot: [state:1][key:8][payload: record_length - 9]
	 *
	 * New keys are appended at the write cursor; existing keys are
	 * re-encoded where they are. Removed slots stay as tombstones until
	 * compact() moves the live slots to the front of a fresh buffer.
	 */
	template <buffer::concepts::ByteBuffer BufferT = buffer::heap_buffer>
	class record_store {
	public:

		using buffer_type = BufferT;
		using key_type = std::int64_t;
		using offset_type = std::size_t;
		using index_type = std::unordered_map<key_type, offset_type>;

		constexpr static offset_type state_offset = 0;
		constexpr static offset_type key_offset = state_offset + 1;
		constexpr static std::size_t slot_header_size = key_offset + sizeof(key_type);

		record_store(std::size_t record_length, std::size_t max_records)
			: record_length_(checked_record_length(record_length))
			, max_records_(checked_max_records(max_records))
			, buffer_(record_length_ * max_records_)
			, live_bits_(core::bitset_bytes_for(max_records_), core::byte{ 0 })
		{
			index_.reserve(max_records_);
		}

		record_store(record_store&&) = default;
		record_store& operator = (record_store&&) = default;
		record_store(const record_store&) = delete;
		record_store& operator = (const record_store&) = delete;

		template <typename TranscoderT, typename SourceT, typename ValueT>
			requires concepts::KeyExtractor<std::remove_cvref_t<TranscoderT>, SourceT>
				&& concepts::Transcoder<std::remove_cvref_t<TranscoderT>, buffer_type, ValueT>
		void store(TranscoderT&& transcoder, const SourceT& key_source, const ValueT& value) {
			const key_type key = static_cast<key_type>(transcoder.extract_key(key_source));

			if (auto it = index_.find(key); it != index_.end()) {
				transcoder.encode(value, buffer_, payload_offset(it->second));
				return;
			}

			if (live_count_ == max_records_) {
				throw core::capacity_exceeded(max_records_);
			}

			if (next_write_offset_ == buffer_.capacity()) {
				compact();
			}

			const offset_type offset = next_write_offset_;
			RECALL_ASSERT(offset % record_length_ == 0, "write cursor is not slot aligned");

			// The slot is still marked empty while the payload is written.
			transcoder.encode(value, buffer_, payload_offset(offset));
			index_.emplace(key, offset);

			buffer_.write_i64(offset + key_offset, key);
			buffer_.write_byte(offset + state_offset, static_cast<std::uint8_t>(slot_state::live));
			get_live_bits().set(slot_of(offset));
			++live_count_;
			next_write_offset_ += record_length_;
		}

		template <typename TranscoderT, typename ValueT>
			requires concepts::Transcoder<std::remove_cvref_t<TranscoderT>, buffer_type, ValueT>
		bool load(key_type key, TranscoderT&& transcoder, ValueT& container) const {
			const auto it = index_.find(key);
			if (it == index_.end()) {
				return false;
			}
			transcoder.decode(buffer_, payload_offset(it->second), container);
			return true;
		}

		bool remove(key_type key) {
			const auto it = index_.find(key);
			if (it == index_.end()) {
				return false;
			}
			const offset_type offset = it->second;
			buffer_.write_byte(offset + state_offset, static_cast<std::uint8_t>(slot_state::tombstone));
			get_live_bits().clear(slot_of(offset));
			index_.erase(it);
			--live_count_;
			return true;
		}

		void compact() {
			buffer_type fresh(buffer_.capacity());
			core::byte_buffer fresh_bits(live_bits_.size(), core::byte{ 0 });
			index_type fresh_index;
			fresh_index.reserve(max_records_);

			core::bitset<core::byte_span> next_bits(fresh_bits, max_records_);
			offset_type write_offset = 0;

			const auto current = get_live_bits();
			for (auto slot = current.find_set_bit(); slot; slot = current.find_set_bit(*slot + 1)) {
				const offset_type from = *slot * record_length_;
				buffer::copy(buffer_, from, fresh, write_offset, record_length_);
				fresh_index.emplace(buffer_.read_i64(from + key_offset), write_offset);
				next_bits.set(slot_of(write_offset));
				write_offset += record_length_;
			}
			RECALL_ASSERT(fresh_index.size() == live_count_, "live slots and index disagree");

			buffer_ = std::move(fresh);
			live_bits_.swap(fresh_bits);
			index_.swap(fresh_index);
			next_write_offset_ = write_offset;
		}

		bool contains(key_type key) const {
			return index_.contains(key);
		}

		// Calls fn(key, offset) for every live slot in slot order.
		template <typename FnT>
		void for_each(FnT&& fn) const {
			const auto bits = get_live_bits();
			for (auto slot = bits.find_set_bit(); slot; slot = bits.find_set_bit(*slot + 1)) {
				const offset_type offset = *slot * record_length_;
				fn(buffer_.read_i64(offset + key_offset), offset);
			}
		}

		slot_state state_at(offset_type offset) const {
			return static_cast<slot_state>(buffer_.read_byte(offset + state_offset));
		}

		offset_type next_write_offset() const noexcept {
			return next_write_offset_;
		}

		std::size_t size() const noexcept {
			return live_count_;
		}

		std::size_t capacity() const noexcept {
			return max_records_;
		}

		std::size_t record_length() const noexcept {
			return record_length_;
		}

		std::size_t payload_size() const noexcept {
			return record_length_ - slot_header_size;
		}

		const buffer_type& buffer() const noexcept {
			return buffer_;
		}

		std::ostream& debug_print(std::ostream& os) const {
			os << std::format("record_store records={}/{} record_length={} next_write_offset={}\n",
				live_count_, max_records_, record_length_, next_write_offset_);
			for (offset_type offset = 0; offset < next_write_offset_; offset += record_length_) {
				const auto state = state_at(offset);
				if (state == slot_state::empty) {
					os << std::format("  [{}] empty\n", slot_of(offset));
					continue;
				}
				os << std::format("  [{}] {} key={}\n", slot_of(offset),
					(state == slot_state::live ? "live" : "tombstone"),
					buffer_.read_i64(offset + key_offset));
			}
			return os;
		}

	PRIVATE_TESTABLE:

		core::bitset<core::byte_span> get_live_bits() noexcept {
			return { live_bits_, max_records_ };
		}

		core::bitset<core::byte_view> get_live_bits() const noexcept {
			return { live_bits_, max_records_ };
		}

		offset_type payload_offset(offset_type offset) const noexcept {
			return offset + slot_header_size;
		}

		std::size_t slot_of(offset_type offset) const noexcept {
			return offset / record_length_;
		}

		static std::size_t checked_record_length(std::size_t record_length) {
			if (record_length <= slot_header_size) {
				throw std::invalid_argument(std::format("record_length must exceed {} bytes, got {}",
					slot_header_size, record_length));
			}
			return record_length;
		}

		static std::size_t checked_max_records(std::size_t max_records) {
			if (max_records == 0) {
				throw std::invalid_argument("max_records must be positive");
			}
			return max_records;
		}

		std::size_t record_length_ = 0;
		std::size_t max_records_ = 0;
		buffer_type buffer_;
		core::byte_buffer live_bits_;
		index_type index_;
		std::size_t live_count_ = 0;
		offset_type next_write_offset_ = 0;
	};

} // namespace recall::store
