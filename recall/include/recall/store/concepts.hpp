/*
 * File: store/concepts.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>

#include "recall/buffer/concepts.hpp"

namespace recall::store::concepts {

    template <typename T, typename SourceT>
    concept KeyExtractor = requires(T t, const SourceT& source) {
        { t.extract_key(source) } -> std::convertible_to<std::int64_t>;
    };

    // `offset` is the first payload byte of the slot. decode must be the
    // exact inverse of encode.
    template <typename T, typename BufferT, typename ValueT>
    concept Transcoder = buffer::concepts::ByteBuffer<BufferT> &&
        requires(T t, const ValueT& value, ValueT& container, BufferT& buf, const BufferT& cbuf, std::size_t off) {
            { t.encode(value, buf, off) } -> std::same_as<void>;
            { t.decode(cbuf, off, container) } -> std::same_as<void>;
        };

} // namespace recall::store::concepts
