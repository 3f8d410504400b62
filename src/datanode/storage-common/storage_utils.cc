/*
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
#include "datanode/storage-common/storage_utils.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <locale>
#include <system_error>

#include "common/exceptions.h"
#include "datanode/storage-common/storage_exceptions.h"
#include "errors/kestrelfs_error_codes.h"
#include "errors/ksfserr.h"
#include "slogger/slogger.h"

namespace storage {

DirectoryConfiguration::DirectoryConfiguration(std::string cfgLine) {
	// Trim leading whitespace characters
	auto forwardIt =
	    std::find_if(cfgLine.begin(), cfgLine.end(), [](char symbol) {
		    return !std::isspace<char>(symbol, std::locale::classic());
	    });
	cfgLine.erase(cfgLine.begin(), forwardIt);

	if (cfgLine.empty()) {
		isEmpty = true;
		return;
	}

	if (cfgLine.at(0) == '#') {  // Skip comments
		isComment = true;
		return;
	}

	// Trim trailing whitespace characters
	auto reverseIt =
	    std::find_if(cfgLine.rbegin(), cfgLine.rend(), [](char symbol) {
		    return !std::isspace<char>(symbol, std::locale::classic());
	    });
	cfgLine.erase(reverseIt.base(), cfgLine.end());

	if (cfgLine.at(0) != '/') {
		ksfs_pretty_syslog(LOG_WARNING,
		                   "Parse data dirs line: %s - storage roots must be "
		                   "absolute paths.",
		                   cfgLine.c_str());
		return;
	}

	path = cfgLine;
	if (path.back() != '/') {
		path.append("/");
	}

	isValid = true;
}

std::vector<std::string> readDataDirsConfig(const std::string &cfgPath) {
	std::ifstream file(cfgPath);
	if (!file.is_open()) {
		throw InitializeException("can't open data directories config file " + cfgPath);
	}

	std::vector<std::string> roots;
	std::string line;
	while (std::getline(file, line)) {
		DirectoryConfiguration configuration(line);
		if (!configuration.isValid) {
			continue;
		}
		if (std::find(roots.begin(), roots.end(), configuration.path) != roots.end()) {
			ksfs::log_warn("data directory {} listed twice in {}", configuration.path, cfgPath);
			continue;
		}
		roots.push_back(std::move(configuration.path));
	}
	return roots;
}

int renameDirectory(const fs::path &from, const fs::path &to) {
	if (::rename(from.c_str(), to.c_str()) < 0) {
		int err = errno;
		ksfs_pretty_syslog(LOG_ERR, "rename(%s, %s) failed: %s", from.c_str(),
		                   to.c_str(), strerr(err));
		return kestrelfs_status_from_errno(err);
	}
	return KESTRELFS_STATUS_OK;
}

int removeDirectory(const fs::path &path) {
	std::error_code errorCode;
	fs::remove_all(path, errorCode);
	if (errorCode) {
		ksfs_pretty_syslog(LOG_ERR, "can't remove %s: %s", path.c_str(),
		                   errorCode.message().c_str());
		return kestrelfs_status_from_errno(errorCode.value());
	}
	return KESTRELFS_STATUS_OK;
}

int createDirectory(const fs::path &path) {
	if (::mkdir(path.c_str(), 0755) < 0) {
		int err = errno;
		ksfs_pretty_syslog(LOG_ERR, "mkdir(%s) failed: %s", path.c_str(), strerr(err));
		return kestrelfs_status_from_errno(err);
	}
	return KESTRELFS_STATUS_OK;
}

int copyFile(const fs::path &from, const fs::path &to) {
	std::error_code errorCode;
	fs::copy_file(from, to, fs::copy_options::none, errorCode);
	if (errorCode) {
		ksfs_pretty_syslog(LOG_ERR, "can't copy %s to %s: %s", from.c_str(),
		                   to.c_str(), errorCode.message().c_str());
		return kestrelfs_status_from_errno(errorCode.value());
	}
	return KESTRELFS_STATUS_OK;
}

int writeFileSynced(const fs::path &path, const std::string &content) {
	int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, kDefaultFileMode);
	if (fd < 0) {
		int err = errno;
		ksfs_pretty_syslog(LOG_ERR, "can't open %s for writing: %s", path.c_str(), strerr(err));
		return kestrelfs_status_from_errno(err);
	}

	size_t written = 0;
	while (written < content.size()) {
		ssize_t ret = ::write(fd, content.data() + written, content.size() - written);
		if (ret < 0) {
			if (errno == EINTR) {
				continue;
			}
			int err = errno;
			ksfs_pretty_syslog(LOG_ERR, "write(%s) failed: %s", path.c_str(), strerr(err));
			::close(fd);
			return kestrelfs_status_from_errno(err);
		}
		written += static_cast<size_t>(ret);
	}

	if (::fsync(fd) < 0) {
		int err = errno;
		ksfs_pretty_syslog(LOG_ERR, "fsync(%s) failed: %s", path.c_str(), strerr(err));
		::close(fd);
		return kestrelfs_status_from_errno(err);
	}
	if (::close(fd) < 0) {
		int err = errno;
		ksfs_pretty_syslog(LOG_ERR, "close(%s) failed: %s", path.c_str(), strerr(err));
		return kestrelfs_status_from_errno(err);
	}
	return KESTRELFS_STATUS_OK;
}

void throwOnError(int status, const std::string &message) {
	if (status != KESTRELFS_STATUS_OK) {
		throw StorageException(message, status);
	}
}

}  // namespace storage
