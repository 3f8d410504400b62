/*
   Copyright 2026 Leil Storage OÜ

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
#include "datanode/storage-common/legacy_storage_file.h"

#include <fcntl.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <cstdint>

#include "datanode/storage-common/storage_exceptions.h"
#include "datanode/storage-common/storage_layout.h"
#include "datanode/storage-common/storage_utils.h"
#include "errors/kestrelfs_error_codes.h"
#include "errors/ksfserr.h"
#include "slogger/slogger.h"

namespace storage {

const std::string kLegacyStorageWarning =
    "\nThis file is INTENTIONALLY CORRUPTED so that versions\n"
    "of KestrelFS prior to the current directory layout\n"
    "(which are incompatible with it) will fail to start.\n";

namespace {

void putInt32BigEndian(std::string &buffer, int32_t value) {
	auto bits = static_cast<uint32_t>(value);
	buffer.push_back(static_cast<char>((bits >> 24) & 0xFF));
	buffer.push_back(static_cast<char>((bits >> 16) & 0xFF));
	buffer.push_back(static_cast<char>((bits >> 8) & 0xFF));
	buffer.push_back(static_cast<char>(bits & 0xFF));
}

}  // namespace

bool isConversionNeeded(const std::filesystem::path &root) {
	auto markerPath = root / kLegacyStorageFileName;
	int fd = ::open(markerPath.c_str(), O_RDONLY);
	if (fd < 0) {
		if (errno == ENOENT) {
			return false;
		}
		int err = errno;
		throw StorageException("can't open " + markerPath.string() + ": " + strerr(err),
		                       kestrelfs_status_from_errno(err));
	}

	std::array<uint8_t, 4> header{};
	ssize_t bytes = ::pread(fd, header.data(), header.size(), 0);
	int err = errno;
	::close(fd);
	if (bytes < 0) {
		throw StorageException("can't read " + markerPath.string() + ": " + strerr(err),
		                       kestrelfs_status_from_errno(err));
	}
	if (bytes < static_cast<ssize_t>(header.size())) {
		// Too short to hold a version, treat it as the oldest layout.
		return true;
	}

	auto oldVersion = static_cast<int32_t>(
	    (static_cast<uint32_t>(header[0]) << 24) | (static_cast<uint32_t>(header[1]) << 16) |
	    (static_cast<uint32_t>(header[2]) << 8) | static_cast<uint32_t>(header[3]));
	return oldVersion >= kLastPreUpgradeLayoutVersion;
}

int corruptPreUpgradeStorage(const std::filesystem::path &root) {
	auto markerPath = root / kLegacyStorageFileName;
	std::error_code errorCode;
	if (std::filesystem::exists(markerPath, errorCode)) {
		return KESTRELFS_STATUS_OK;
	}

	std::string content;
	putInt32BigEndian(content, kCurrentLayoutVersion);
	// Zero length modified-UTF-8 string, the layout once stored a name here.
	content.push_back('\0');
	content.push_back('\0');
	content += kLegacyStorageWarning;

	int status = writeFileSynced(markerPath, content);
	if (status != KESTRELFS_STATUS_OK) {
		ksfs::log_err("can't write legacy storage marker {}: {}", markerPath.string(),
		              kestrelfs_error_string(status));
	}
	return status;
}

}  // namespace storage
