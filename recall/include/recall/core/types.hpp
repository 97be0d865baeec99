/*
 * File: types.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include "recall/core/byteorder.hpp"

namespace recall::core {
	using word_u32 = byteorder::word_le<std::uint32_t>;
	using word_u64 = byteorder::word_le<std::uint64_t>;
	using word_i64 = byteorder::word_le<std::int64_t>;
} // namespace recall::core
