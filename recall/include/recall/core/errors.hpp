/*
 * File: errors.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstddef>
#include <format>
#include <stdexcept>

namespace recall::core {

	class capacity_exceeded : public std::runtime_error {
	public:
		explicit capacity_exceeded(std::size_t capacity)
			: std::runtime_error(std::format("capacity exceeded: {} records", capacity))
			, capacity_(capacity)
		{}

		std::size_t capacity() const noexcept {
			return capacity_;
		}

	private:
		std::size_t capacity_ = 0;
	};

} // namespace recall::core
