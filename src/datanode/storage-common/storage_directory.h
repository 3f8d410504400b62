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

#pragma once

#include "common/platform.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "datanode/storage-common/storage_info.h"
#include "datanode/storage-common/storage_utils.h"

namespace storage {

/// Condition of a storage directory found while probing it.
enum class StorageState {
	kNonExistent,         ///< Missing, not a directory or not writable.
	kNotFormatted,        ///< Empty or new, has to be formatted.
	kCompleteUpgrade,     ///< previous.tmp with a valid current.
	kRecoverUpgrade,      ///< previous.tmp without a valid current.
	kCompleteFinalize,    ///< finalized.tmp left behind.
	kCompleteRollback,    ///< removed.tmp with a valid current.
	kRecoverRollback,     ///< removed.tmp with previous only.
	kCompleteCheckpoint,  ///< lastcheckpoint.tmp with a valid current.
	kRecoverCheckpoint,   ///< lastcheckpoint.tmp without a valid current.
	kNormal,              ///< Consistent, nothing to do.
};

std::string toString(StorageState state);

/**
 * @brief One storage directory: a storage root of the node or a namespace
 * slice nested in one.
 *
 * Both kinds share the same layout (current, previous and the transition
 * staging directories) and the same in_use.lock protocol. The lock taken by
 * analyze() is held until unlock() or destruction.
 */
class StorageDirectory {
public:
	explicit StorageDirectory(std::filesystem::path root);

	// No need to copy or move them so far
	StorageDirectory(const StorageDirectory &) = delete;
	StorageDirectory(StorageDirectory &&) = delete;
	StorageDirectory &operator=(const StorageDirectory &) = delete;
	StorageDirectory &operator=(StorageDirectory &&) = delete;

	~StorageDirectory() = default;

	const std::filesystem::path &root() const { return root_; }

	std::filesystem::path currentDir() const { return root_ / kCurrentDirName; }
	std::filesystem::path previousDir() const { return root_ / kPreviousDirName; }
	std::filesystem::path previousTmpDir() const { return root_ / kPreviousTmpDirName; }
	std::filesystem::path removedTmpDir() const { return root_ / kRemovedTmpDirName; }
	std::filesystem::path finalizedTmpDir() const { return root_ / kFinalizedTmpDirName; }
	std::filesystem::path lastCheckpointTmpDir() const { return root_ / kLastCheckpointTmpDirName; }
	std::filesystem::path previousCheckpointDir() const {
		return root_ / kPreviousCheckpointDirName;
	}
	std::filesystem::path versionFile() const { return currentDir() / kVersionFileName; }
	std::filesystem::path previousVersionFile() const {
		return previousDir() / kVersionFileName;
	}

	/**
	 * @brief Classifies the directory and locks it when it is usable.
	 *
	 * @param option   Startup intent. With kFormat a missing root is created
	 *                 and always reported as kNotFormatted.
	 * @param siblings Directories already locked by this node, used to detect
	 *                 two configured paths pointing to the same directory.
	 * @throws InconsistentStateException for contradicting leftovers,
	 *         InitializeException when the lock cannot be taken,
	 *         StorageException for I/O errors.
	 */
	StorageState analyze(StartupOption option,
	                     const std::vector<const StorageDirectory *> &siblings = {});

	/// Finishes the transition interrupted in `state`. Throws StorageException.
	void recover(StorageState state);

	/// Takes the in_use.lock. See analyze() for the siblings parameter.
	void lock(const std::vector<const StorageDirectory *> &siblings = {});

	/// Releases the lock, no-op when not locked.
	void unlock();

	bool isLocked() const { return lockFile_ != nullptr; }

	/// True if this directory holds the lock file identified by dev/inode.
	bool holdsLockFile(dev_t dev, ino_t inode) const;

	/// Removes current with everything in it and recreates it empty.
	void clearDirectory();

	bool hasCurrentVersion() const;
	bool hasPrevious() const;

private:
	std::filesystem::path root_;
	std::unique_ptr<LockFile> lockFile_;
};

}  // namespace storage
