/*
 * File: buffer/ops.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstring>
#include <format>
#include <stdexcept>

#include "recall/buffer/concepts.hpp"

namespace recall::buffer {

    // Bulk copy between two buffers; the regions may overlap when src and
    // dst are the same buffer.
    template <concepts::ByteBuffer SrcT, concepts::ByteBuffer DstT>
    void copy(const SrcT& src, std::size_t src_off, DstT& dst, std::size_t dst_off, std::size_t len) {
        const core::byte_view from = src.data();
        const core::byte_span to = dst.data();
        if (src_off > from.size() || len > from.size() - src_off
            || dst_off > to.size() || len > to.size() - dst_off) {
            throw std::out_of_range(std::format("copy: {} bytes from {} to {} does not fit ({} -> {})",
                len, src_off, dst_off, from.size(), to.size()));
        }
        if (len != 0) {
            std::memmove(to.data() + dst_off, from.data() + src_off, len);
        }
    }

} // namespace recall::buffer
