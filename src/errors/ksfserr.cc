/*
   Copyright 2005-2010 Jakub Kruszona-Zawadzki, Gemius SA
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

#include "common/platform.h"
#include "ksfserr.h"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <string>
#include <unordered_map>

#include "kestrelfs_error_codes.h"

int kestrelfs_error_conv(uint8_t status) {
	switch (status) {
		case KESTRELFS_STATUS_OK:
			return 0;
		case KESTRELFS_ERROR_EPERM:
			return EPERM;
		case KESTRELFS_ERROR_ENOTDIR:
			return ENOTDIR;
		case KESTRELFS_ERROR_ENOENT:
			return ENOENT;
		case KESTRELFS_ERROR_EACCES:
			return EACCES;
		case KESTRELFS_ERROR_EEXIST:
			return EEXIST;
		case KESTRELFS_ERROR_EINVAL:
			return EINVAL;
		case KESTRELFS_ERROR_ENOTEMPTY:
			return ENOTEMPTY;
		case KESTRELFS_ERROR_LOCKED:
			return EAGAIN;
		case KESTRELFS_ERROR_NOSPACE:
			return ENOSPC;
		case KESTRELFS_ERROR_IO:
			return EIO;
		case KESTRELFS_ERROR_EROFS:
			return EROFS;
		case KESTRELFS_ERROR_ENAMETOOLONG:
			return ENAMETOOLONG;
		case KESTRELFS_ERROR_EMLINK:
			return EMLINK;
		case KESTRELFS_ERROR_EXDEV:
			return EXDEV;
		default:
			return EINVAL;
	}
}

uint8_t kestrelfs_status_from_errno(int error) {
	switch (error) {
		case 0:
			return KESTRELFS_STATUS_OK;
		case EPERM:
			return KESTRELFS_ERROR_EPERM;
		case ENOTDIR:
			return KESTRELFS_ERROR_ENOTDIR;
		case ENOENT:
			return KESTRELFS_ERROR_ENOENT;
		case EACCES:
			return KESTRELFS_ERROR_EACCES;
		case EEXIST:
			return KESTRELFS_ERROR_EEXIST;
		case EINVAL:
			return KESTRELFS_ERROR_EINVAL;
		case ENOTEMPTY:
			return KESTRELFS_ERROR_ENOTEMPTY;
		case EAGAIN:
			return KESTRELFS_ERROR_LOCKED;
		case ENOSPC:
			return KESTRELFS_ERROR_NOSPACE;
		case EROFS:
			return KESTRELFS_ERROR_EROFS;
		case ENAMETOOLONG:
			return KESTRELFS_ERROR_ENAMETOOLONG;
		case EMLINK:
			return KESTRELFS_ERROR_EMLINK;
		case EXDEV:
			return KESTRELFS_ERROR_EXDEV;
		default:
			return KESTRELFS_ERROR_IO;
	}
}

const char *strerr(int error_code) {
	static std::unordered_map<int, std::string> error_description;
	static std::mutex error_description_mutex;

	std::lock_guard<std::mutex> guard(error_description_mutex);
	auto it = error_description.find(error_code);
	if (it != error_description.end()) {
		return it->second.c_str();
	}

	const char *error_string = strerror(error_code);
	auto insert_it = error_description.insert({error_code, std::string(error_string)}).first;
	return insert_it->second.c_str();
}
