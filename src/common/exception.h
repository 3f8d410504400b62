/*
   Copyright 2013-2014 EditShare
   Copyright 2013-2017 Skytechnology sp. z o.o.
   Copyright 2023-2026 Leil Storage OÜ

   This file is part of KestrelFS.

   KestrelFS is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, version 3.

   KestrelFS is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with KestrelFS. If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include "common/platform.h"

#include <cassert>
#include <cstdint>
#include <exception>
#include <string>

#include "errors/kestrelfs_error_codes.h"

class Exception : public std::exception {
public:
	Exception(const std::string& message) : message_(message), status_(KESTRELFS_ERROR_UNKNOWN) {
	}

	Exception(const std::string& message, uint8_t status) : message_(message), status_(status) {
		assert(status != KESTRELFS_STATUS_OK);
		if (status != KESTRELFS_ERROR_UNKNOWN) {
			message_ += " (" + std::string(kestrelfs_error_string(status)) + ")";
		}
	}

	~Exception() noexcept {
	}

	const char* what() const noexcept override {
		return message_.c_str();
	}

	const std::string& message() const {
		return message_;
	}

	uint8_t status() const {
		return status_;
	}

private:
	std::string message_;
	uint8_t status_;
};

#define KESTRELFS_CREATE_EXCEPTION_CLASS(name, base) \
	class name : public base { \
	public: \
		name(const std::string& message) : base(message) {} \
		name(const std::string& message, uint8_t status) : base(message, status) {} \
		~name() noexcept {} \
	}
