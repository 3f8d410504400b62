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

#pragma once

#include "common/platform.h"

#include <sys/types.h>
#include <unistd.h>
#include <filesystem>
#include <string>
#include <vector>

#include "common/massert.h"

namespace storage {

namespace fs = std::filesystem;

static constexpr mode_t kLockFileMode = 0640;
static constexpr mode_t kDefaultFileMode = 0644;

/// Lock class to avoid different datanodes using the same storage root
class LockFile {
public:
	/// Constructor of a LockFile object.
	///
	/// \param fd    Lock-file's file descriptor, already locked.
	/// \param dev   Lock-file's device number (probably from stat).
	/// \param inode Lock-file's Inode number.
	LockFile(int fileDescriptor, dev_t dev, ino_t inode)
	    : fd_(fileDescriptor), device_(dev), inode_(inode) {
		sassert(fileDescriptor != -1);
	}

	// No need for copying or moving lock file objects.
	LockFile(const LockFile &) = delete;
	LockFile(LockFile &&) = delete;
	LockFile &operator=(const LockFile &) = delete;
	LockFile &operator=(LockFile &&) = delete;

	/// Releases the lock.
	~LockFile() {
		if (fd_ >= 0) {
			close(fd_);
		}
	}

	/// True if this lock file is the same.
	bool isTheSameFile(dev_t dev, ino_t inode) const {
		return device_ == dev && inode_ == inode;
	}

private:
	int fd_ = -1;   ///< Lock-file's file descriptor.
	dev_t device_;  ///< Lock-file's device number.
	ino_t inode_;   ///< Lock-file's Inode number.
};

/// Storage root description parsed from the data directories config file.
struct DirectoryConfiguration {
	/// Constructor: parses one line of the data directories config file.
	explicit DirectoryConfiguration(std::string cfgLine);

	/// The storage root, always ending with '/'.
	std::string path;

	/// The line was parsed correctly
	bool isValid = false;

	/// The line was prefixed with '#' character
	bool isComment = false;

	/// It is a blank line
	bool isEmpty = false;
};

/// Reads the list of storage roots from the data directories config file.
/// Throws InitializeException when the file cannot be opened.
std::vector<std::string> readDataDirsConfig(const std::string &cfgPath);

/// Renames a directory. Returns KESTRELFS_STATUS_OK or an error status.
int renameDirectory(const fs::path &from, const fs::path &to);

/// Removes a directory tree. A missing path is not an error.
int removeDirectory(const fs::path &path);

/// Creates a single directory, the parent must exist.
int createDirectory(const fs::path &path);

/// Copies a regular file byte by byte, the target must not exist.
int copyFile(const fs::path &from, const fs::path &to);

/// Writes the whole content to path (truncating it) and fsyncs the file.
int writeFileSynced(const fs::path &path, const std::string &content);

/// Throws StorageException(message, status) when status is not OK.
void throwOnError(int status, const std::string &message);

}  // namespace storage
