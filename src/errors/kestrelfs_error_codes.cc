/*
   Copyright 2013-2014 EditShare
   Copyright 2013-2015 Skytechnology sp. z o.o.
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

#include "kestrelfs_error_codes.h"

const char *kestrelfs_error_string(uint8_t status) {
	static const char * const error_strings[KESTRELFS_ERROR_MAX + 1] = {
		"OK",
		"Operation not permitted",
		"Not a directory",
		"No such file or directory",
		"Permission denied",
		"File exists",
		"Invalid argument",
		"Directory not empty",
		"Resource locked",
		"Requested operation not completed",
		"Wrong layout version",
		"No space left",
		"IO error",
		"Can't create path",
		"Data mismatch",
		"Read-only file system",
		"Parsing unsuccessful",
		"Metadata version mismatch",
		"Operation not possible",
		"Unknown KestrelFS error",
		"Name too long",
		"Too many links",
		"Cross-device link",
		"Unknown KestrelFS error"
	};
	status = (status <= KESTRELFS_ERROR_MAX) ? status : (uint8_t)KESTRELFS_ERROR_MAX;
	return error_strings[status];
}
