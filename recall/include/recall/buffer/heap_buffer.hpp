/*
 * File: buffer/heap_buffer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once
#include <cstdint>
#include <format>
#include <stdexcept>
#include <vector>

#include "recall/core/bytes.hpp"
#include "recall/core/byteorder.hpp"
#include "recall/buffer/concepts.hpp"

namespace recall::buffer {

    // Vector backed region. Every access is range checked and throws
    // std::out_of_range on violation.
    class heap_buffer {
    public:
        using offset_type = std::size_t;

        explicit heap_buffer(std::size_t capacity)
            : data_(capacity, core::byte{ 0 })
        {}

        std::size_t capacity() const noexcept { return data_.size(); }

        std::int64_t read_i64(offset_type off) const {
            check_range(off, sizeof(std::int64_t));
            return core::byteorder::le_to_native<std::int64_t>(data_.data() + off);
        }

        void write_i64(offset_type off, std::int64_t val) {
            check_range(off, sizeof(std::int64_t));
            core::byteorder::native_to_le<std::int64_t>(val, data_.data() + off);
        }

        std::uint32_t read_u32(offset_type off) const {
            check_range(off, sizeof(std::uint32_t));
            return core::byteorder::le_to_native<std::uint32_t>(data_.data() + off);
        }

        void write_u32(offset_type off, std::uint32_t val) {
            check_range(off, sizeof(std::uint32_t));
            core::byteorder::native_to_le<std::uint32_t>(val, data_.data() + off);
        }

        std::uint8_t read_byte(offset_type off) const {
            check_range(off, 1);
            return static_cast<std::uint8_t>(data_[off]);
        }

        void write_byte(offset_type off, std::uint8_t val) {
            check_range(off, 1);
            data_[off] = static_cast<core::byte>(val);
        }

        core::byte_span data() noexcept { return data_; }
        core::byte_view data() const noexcept { return data_; }

    private:

        void check_range(offset_type off, std::size_t n) const {
            if (off > data_.size() || n > data_.size() - off) {
                throw std::out_of_range(std::format("heap_buffer: access [{}, {}) outside of {} bytes",
                    off, off + n, data_.size()));
            }
        }

        core::byte_buffer data_;
    };
    static_assert(concepts::ByteBuffer<heap_buffer>);
}
