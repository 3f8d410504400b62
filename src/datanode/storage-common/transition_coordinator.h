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
#include <stop_token>
#include <vector>

#include "common/parallel_helpers.h"
#include "datanode/storage-common/async_dir_remover.h"
#include "datanode/storage-common/storage_directory.h"
#include "datanode/storage-common/storage_info.h"
#include "datanode/storage-common/transition_result.h"
#include "datanode/storage-common/transition_workers.h"
#include "datanode/storage-common/upgrade_manager.h"

namespace storage {

/**
 * @brief State machine driving a set of storage directories to the layout
 * and creation time of a namespace.
 *
 * The sequence is: probe every directory (format the new ones, finish the
 * interrupted transitions, exclude the unusable ones), roll back when asked
 * to, compare every version record with the namespace and upgrade the stale
 * directories concurrently.
 *
 * Subclasses define the scope: a whole storage root or a namespace slice.
 */
class TransitionCoordinator {
public:
	explicit TransitionCoordinator(IUpgradeManager &upgradeManager);
	virtual ~TransitionCoordinator() = default;

	TransitionCoordinator(const TransitionCoordinator &) = delete;
	TransitionCoordinator &operator=(const TransitionCoordinator &) = delete;

	/// Usable directories, in configuration order.
	const std::vector<std::unique_ptr<StorageDirectory>> &directories() const {
		return directories_;
	}

	/// Outcome per configured directory of the last pass.
	const std::vector<TransitionResult> &lastTransitionResults() const { return results_; }

	/// Version state written to every directory.
	const StorageInfo &storageInfo() const { return info_; }

	/// Stops waiting for rollback workers. A pass interrupted this way
	/// returns without committing anything. The next pass waits for the
	/// abandoned workers and starts with a fresh stop state.
	virtual void requestStop() { stopSource_.request_stop(); }

	/// Finalizes every directory with a snapshot, returns how many were found.
	int finalizeAll(AsyncDirectoryRemover &remover);

	/// Releases the locks of every directory.
	void unlockAll();

protected:
	/// Probes, formats and recovers `roots`. Throws StorageException when no
	/// directory is left.
	void probeDirectories(const std::vector<std::filesystem::path> &roots,
	                      const NamespaceDescriptor &nsInfo, StartupOption option);

	/// Rollback (when asked), version checks and upgrade. Returns false when
	/// the rollback wait was interrupted.
	bool doTransition(const NamespaceDescriptor &nsInfo, StartupOption option);

	virtual StorageLevel level() const = 0;

	/// Clears the directory and writes a fresh version record.
	virtual void format(StorageDirectory &directory, const NamespaceDescriptor &nsInfo) = 0;

	/// Reads the version record of `directory`.
	virtual StorageInfo readStorageInfo(const StorageDirectory &directory,
	                                    const NamespaceDescriptor &nsInfo) = 0;

	/// Writes the version record of `directory`.
	virtual void writeStorageInfo(const StorageDirectory &directory, const StorageInfo &info) = 0;

	/// True if the namespace id stored with `info` has to match the namespace.
	virtual bool isNamespaceIdChecked(const StorageInfo &info) const = 0;

	virtual bool isUpgradeRequired(const StorageInfo &info,
	                               const NamespaceDescriptor &nsInfo) const;

	StorageInfo info_;
	IUpgradeManager &upgradeManager_;

private:
	struct UpgradeCandidate {
		StorageDirectory *directory;
		StorageInfo info;
	};

	void doUpgrade(const std::vector<UpgradeCandidate> &candidates,
	               const NamespaceDescriptor &nsInfo);
	bool doRollback(const NamespaceDescriptor &nsInfo);
	void joinAbandonedRollbacks();
	void markResult(const StorageDirectory &directory, TransitionResult::Kind kind,
	                const std::string &cause = {});

	std::vector<std::unique_ptr<StorageDirectory>> directories_;
	std::vector<TransitionResult> results_;
	std::stop_source stopSource_;
	// Rollback workers abandoned by an interrupted wait, they are joined by
	// the next pass or on destruction, before their directories go away.
	std::vector<std::unique_ptr<parallel::WorkerGroup>> abandonedRollbacks_;
};

}  // namespace storage
