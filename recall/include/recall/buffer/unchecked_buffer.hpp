/*
 * File: buffer/unchecked_buffer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once
#include <cstdint>
#include <memory>

#include "recall/core/bytes.hpp"
#include "recall/core/byteorder.hpp"
#include "recall/core/debug.hpp"
#include "recall/buffer/concepts.hpp"

namespace recall::buffer {

    // Raw heap block without runtime range checks; RECALL_ASSERT only.
    class unchecked_buffer {
    public:
        using offset_type = std::size_t;

        explicit unchecked_buffer(std::size_t capacity)
            : data_(std::make_unique<core::byte[]>(capacity))
            , capacity_(capacity)
        {}

        unchecked_buffer(unchecked_buffer&&) noexcept = default;
        unchecked_buffer& operator = (unchecked_buffer&&) noexcept = default;

        std::size_t capacity() const noexcept { return capacity_; }

        std::int64_t read_i64(offset_type off) const {
            RECALL_ASSERT(off + sizeof(std::int64_t) <= capacity_, "read_i64 out of range");
            return core::byteorder::le_to_native<std::int64_t>(data_.get() + off);
        }

        void write_i64(offset_type off, std::int64_t val) {
            RECALL_ASSERT(off + sizeof(std::int64_t) <= capacity_, "write_i64 out of range");
            core::byteorder::native_to_le<std::int64_t>(val, data_.get() + off);
        }

        std::uint32_t read_u32(offset_type off) const {
            RECALL_ASSERT(off + sizeof(std::uint32_t) <= capacity_, "read_u32 out of range");
            return core::byteorder::le_to_native<std::uint32_t>(data_.get() + off);
        }

        void write_u32(offset_type off, std::uint32_t val) {
            RECALL_ASSERT(off + sizeof(std::uint32_t) <= capacity_, "write_u32 out of range");
            core::byteorder::native_to_le<std::uint32_t>(val, data_.get() + off);
        }

        std::uint8_t read_byte(offset_type off) const {
            RECALL_ASSERT(off < capacity_, "read_byte out of range");
            return static_cast<std::uint8_t>(data_[off]);
        }

        void write_byte(offset_type off, std::uint8_t val) {
            RECALL_ASSERT(off < capacity_, "write_byte out of range");
            data_[off] = static_cast<core::byte>(val);
        }

        core::byte_span data() noexcept { return { data_.get(), capacity_ }; }
        core::byte_view data() const noexcept { return { data_.get(), capacity_ }; }

    private:
        std::unique_ptr<core::byte[]> data_;
        std::size_t capacity_ = 0;
    };
    static_assert(concepts::ByteBuffer<unchecked_buffer>);
}
