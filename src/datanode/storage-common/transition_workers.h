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

#include <string>

#include "datanode/storage-common/async_dir_remover.h"
#include "datanode/storage-common/hard_link_migrator.h"
#include "datanode/storage-common/storage_directory.h"
#include "datanode/storage-common/storage_info.h"

namespace storage {

/// Scope a transition applies to. Selects which fields guard a rollback and
/// which snapshots may not coexist with an upgrade.
enum class StorageLevel {
	kNodeLevel,       ///< A whole storage root.
	kNamespaceLevel,  ///< A namespace slice nested in a storage root.
};

std::string toString(StorageLevel level);

/**
 * @brief Moves one storage directory to the current layout.
 *
 * current is renamed to previous.tmp and rebuilt from it with hard links.
 * The version record and the final previous.tmp -> previous rename are left
 * to the caller, which does them only once every worker succeeded.
 *
 * A storage root coming from a pre-federation layout gets its blocks moved
 * into the slice of the namespace it belonged to.
 */
class UpgradeWorker {
public:
	UpgradeWorker(const StorageDirectory &directory, StorageLevel level, StorageInfo oldInfo,
	              NamespaceDescriptor nsInfo);

	/// Throws InconsistentStateException when a snapshot of the other level
	/// exists, StorageException on I/O errors.
	void run();

	const StorageDirectory &directory() const { return directory_; }
	const LinkStatistics &statistics() const { return statistics_; }

private:
	/// Fails when a namespace slice of the root has a snapshot.
	void checkSnapshotCoexistence() const;
	void linkNodeLevel(HardLinkMigrator &migrator);

	const StorageDirectory &directory_;
	StorageLevel level_;
	StorageInfo oldInfo_;
	NamespaceDescriptor nsInfo_;
	LinkStatistics statistics_;
};

/**
 * @brief Restores the snapshot of one storage directory.
 *
 * A directory without previous is left alone. Otherwise the snapshot state
 * has to be one the namespace can accept: at node level its layout must not
 * be newer than kCurrentLayoutVersion, at namespace level its creation time
 * must not be newer than the namespace's.
 */
class RollbackWorker {
public:
	RollbackWorker(const StorageDirectory &directory, StorageLevel level,
	               NamespaceDescriptor nsInfo);

	/// Throws InconsistentStateException for a snapshot newer than the
	/// namespace, StorageException on I/O errors.
	void run();

	/// True once the snapshot was restored.
	bool rolledBack() const { return rolledBack_; }

	const StorageDirectory &directory() const { return directory_; }

private:
	StorageInfo readPreviousState() const;

	const StorageDirectory &directory_;
	StorageLevel level_;
	NamespaceDescriptor nsInfo_;
	bool rolledBack_ = false;
};

/// Accepts the upgrade of `directory`: previous is renamed to finalized.tmp
/// which is then removed by `remover`. Returns false when there was no
/// snapshot. Throws StorageException when the rename fails.
bool finalizeDirectory(const StorageDirectory &directory, const StorageInfo &info,
                       AsyncDirectoryRemover &remover);

}  // namespace storage
