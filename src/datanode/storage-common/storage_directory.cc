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
#include "datanode/storage-common/storage_directory.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>

#include "common/exceptions.h"
#include "datanode/storage-common/legacy_storage_file.h"
#include "datanode/storage-common/storage_exceptions.h"
#include "errors/kestrelfs_error_codes.h"
#include "errors/ksfserr.h"
#include "slogger/slogger.h"

namespace storage {

namespace {

bool pathExists(const fs::path &path) {
	std::error_code errorCode;
	return fs::exists(path, errorCode);
}

}  // namespace

std::string toString(StorageState state) {
	switch (state) {
	case StorageState::kNonExistent:
		return "NON_EXISTENT";
	case StorageState::kNotFormatted:
		return "NOT_FORMATTED";
	case StorageState::kCompleteUpgrade:
		return "COMPLETE_UPGRADE";
	case StorageState::kRecoverUpgrade:
		return "RECOVER_UPGRADE";
	case StorageState::kCompleteFinalize:
		return "COMPLETE_FINALIZE";
	case StorageState::kCompleteRollback:
		return "COMPLETE_ROLLBACK";
	case StorageState::kRecoverRollback:
		return "RECOVER_ROLLBACK";
	case StorageState::kCompleteCheckpoint:
		return "COMPLETE_CHECKPOINT";
	case StorageState::kRecoverCheckpoint:
		return "RECOVER_CHECKPOINT";
	case StorageState::kNormal:
		return "NORMAL";
	}
	return "UNKNOWN";
}

StorageDirectory::StorageDirectory(std::filesystem::path root) : root_(std::move(root)) {
	// Keep "/data/dn1/" and "/data/dn1" equal.
	if (!root_.has_filename() && root_.has_parent_path() && root_ != root_.root_path()) {
		root_ = root_.parent_path();
	}
}

bool StorageDirectory::hasCurrentVersion() const {
	return pathExists(versionFile());
}

bool StorageDirectory::hasPrevious() const {
	return pathExists(previousDir());
}

bool StorageDirectory::holdsLockFile(dev_t dev, ino_t inode) const {
	return lockFile_ != nullptr && lockFile_->isTheSameFile(dev, inode);
}

void StorageDirectory::lock(const std::vector<const StorageDirectory *> &siblings) {
	if (isLocked()) {
		return;
	}
	auto lockFilename = root_ / kLockFileName;

	// Look for duplicates before locking: lockf locks belong to the process,
	// closing a second descriptor of the same file would drop the first lock.
	struct stat lockStat {};
	if (::stat(lockFilename.c_str(), &lockStat) == 0) {
		for (const auto *sibling : siblings) {
			if (sibling != this && sibling->holdsLockFile(lockStat.st_dev, lockStat.st_ino)) {
				throw InitializeException("storage directories " + root_.string() + " and " +
				                          sibling->root().string() +
				                          " have the same lock file");
			}
		}
	}

	int lockFD = ::open(lockFilename.c_str(), O_RDWR | O_CREAT, kLockFileMode);
	if (lockFD < 0) {
		int err = errno;
		throw StorageException("can't create lock file " + lockFilename.string() + ": " +
		                           strerr(err),
		                       kestrelfs_status_from_errno(err));
	}

	if (::lockf(lockFD, F_TLOCK, 0) < 0) {
		const int err = errno;
		::close(lockFD);
		if (err == EAGAIN || err == EACCES) {
			throw InitializeException("storage directory " + root_.string() +
			                          " already locked by another process");
		}
		throw StorageException("lockf(" + lockFilename.string() + ") failed: " + strerr(err),
		                       kestrelfs_status_from_errno(err));
	}

	if (::fstat(lockFD, &lockStat) < 0) {
		const int err = errno;
		::close(lockFD);
		throw StorageException("fstat(" + lockFilename.string() + ") failed: " + strerr(err),
		                       kestrelfs_status_from_errno(err));
	}

	lockFile_ = std::make_unique<LockFile>(lockFD, lockStat.st_dev, lockStat.st_ino);
	ksfs::log_debug("locked storage directory {}", root_.string());
}

void StorageDirectory::unlock() {
	if (lockFile_ != nullptr) {
		lockFile_.reset();
		ksfs::log_debug("unlocked storage directory {}", root_.string());
	}
}

StorageState StorageDirectory::analyze(StartupOption option,
                                       const std::vector<const StorageDirectory *> &siblings) {
	std::error_code errorCode;
	if (!fs::exists(root_, errorCode)) {
		if (option != StartupOption::kFormat) {
			ksfs::log_info("storage directory {} does not exist", root_.string());
			return StorageState::kNonExistent;
		}
		ksfs::log_info("{} does not exist, creating", root_.string());
		if (!fs::create_directories(root_, errorCode)) {
			throw StorageException("can't create directory " + root_.string() + ": " +
			                           errorCode.message(),
			                       KESTRELFS_ERROR_CANTCREATEPATH);
		}
	}

	if (!fs::is_directory(root_, errorCode)) {
		ksfs::log_info("{} is not a directory", root_.string());
		return StorageState::kNonExistent;
	}
	if (::access(root_.c_str(), W_OK) < 0) {
		ksfs::log_info("cannot access storage directory {}", root_.string());
		return StorageState::kNonExistent;
	}

	lock(siblings);

	if (option == StartupOption::kFormat) {
		return StorageState::kNotFormatted;
	}

	if (isConversionNeeded(root_)) {
		throw InconsistentStateException(root_.string() +
		                                     " has an old layout, conversion is not supported",
		                                 KESTRELFS_ERROR_WRONGVERSION);
	}

	bool hasCurrent = hasCurrentVersion();
	bool hasPreviousDir = hasPrevious();
	bool hasPreviousTmp = pathExists(previousTmpDir());
	bool hasRemovedTmp = pathExists(removedTmpDir());
	bool hasFinalizedTmp = pathExists(finalizedTmpDir());
	bool hasCheckpointTmp = pathExists(lastCheckpointTmpDir());

	if (!(hasPreviousTmp || hasRemovedTmp || hasFinalizedTmp || hasCheckpointTmp)) {
		if (hasCurrent) {
			return StorageState::kNormal;
		}
		if (hasPreviousDir) {
			throw InconsistentStateException(
			    root_.string() + ": version file in current directory is missing");
		}
		return StorageState::kNotFormatted;
	}

	int tmpDirs = static_cast<int>(hasPreviousTmp) + static_cast<int>(hasRemovedTmp) +
	              static_cast<int>(hasFinalizedTmp) + static_cast<int>(hasCheckpointTmp);
	if (tmpDirs > 1) {
		throw InconsistentStateException(root_.string() + ": too many temporary directories");
	}

	if (hasCheckpointTmp) {
		return hasCurrent ? StorageState::kCompleteCheckpoint : StorageState::kRecoverCheckpoint;
	}

	if (hasFinalizedTmp) {
		if (hasPreviousDir) {
			throw InconsistentStateException(root_.string() + ": " + kFinalizedTmpDirName +
			                                 " and " + kPreviousDirName +
			                                 " directories cannot exist together");
		}
		return StorageState::kCompleteFinalize;
	}

	if (hasPreviousTmp) {
		if (hasPreviousDir) {
			throw InconsistentStateException(root_.string() + ": " + kPreviousDirName + " and " +
			                                 kPreviousTmpDirName + " cannot exist together");
		}
		return hasCurrent ? StorageState::kCompleteUpgrade : StorageState::kRecoverUpgrade;
	}

	// removed.tmp is left
	if (hasCurrent == hasPreviousDir) {
		throw InconsistentStateException(root_.string() + ": one and only one directory " +
		                                 kCurrentDirName + " or " + kPreviousDirName +
		                                 " must be present when " + kRemovedTmpDirName +
		                                 " exists");
	}
	return hasCurrent ? StorageState::kCompleteRollback : StorageState::kRecoverRollback;
}

void StorageDirectory::recover(StorageState state) {
	const auto rootName = root_.string();
	switch (state) {
	case StorageState::kCompleteUpgrade:
		ksfs::log_info("Completing previous upgrade for storage directory {}", rootName);
		throwOnError(renameDirectory(previousTmpDir(), previousDir()),
		             "can't complete upgrade of " + rootName);
		return;
	case StorageState::kRecoverUpgrade:
		ksfs::log_info("Recovering storage directory {} from previous upgrade", rootName);
		throwOnError(removeDirectory(currentDir()), "can't remove current of " + rootName);
		throwOnError(renameDirectory(previousTmpDir(), currentDir()),
		             "can't recover upgrade of " + rootName);
		return;
	case StorageState::kCompleteRollback:
		ksfs::log_info("Completing previous rollback for storage directory {}", rootName);
		throwOnError(removeDirectory(removedTmpDir()), "can't complete rollback of " + rootName);
		return;
	case StorageState::kRecoverRollback:
		ksfs::log_info("Recovering storage directory {} from previous rollback", rootName);
		throwOnError(renameDirectory(removedTmpDir(), currentDir()),
		             "can't recover rollback of " + rootName);
		return;
	case StorageState::kCompleteFinalize:
		ksfs::log_info("Completing previous finalize for storage directory {}", rootName);
		throwOnError(removeDirectory(finalizedTmpDir()), "can't complete finalize of " + rootName);
		return;
	case StorageState::kCompleteCheckpoint:
		ksfs::log_info("Completing previous checkpoint for storage directory {}", rootName);
		throwOnError(removeDirectory(previousCheckpointDir()),
		             "can't remove previous checkpoint of " + rootName);
		throwOnError(renameDirectory(lastCheckpointTmpDir(), previousCheckpointDir()),
		             "can't complete checkpoint of " + rootName);
		return;
	case StorageState::kRecoverCheckpoint:
		ksfs::log_info("Recovering storage directory {} from failed checkpoint", rootName);
		throwOnError(removeDirectory(currentDir()), "can't remove current of " + rootName);
		throwOnError(renameDirectory(lastCheckpointTmpDir(), currentDir()),
		             "can't recover checkpoint of " + rootName);
		return;
	case StorageState::kNonExistent:
	case StorageState::kNotFormatted:
	case StorageState::kNormal:
		break;
	}
	throw StorageException("unexpected storage state " + toString(state) + " of " + rootName,
	                       KESTRELFS_ERROR_EINVAL);
}

void StorageDirectory::clearDirectory() {
	auto current = currentDir();
	throwOnError(removeDirectory(current), "can't remove " + current.string());
	throwOnError(createDirectory(current), "can't create " + current.string());
}

}  // namespace storage
