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

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "datanode/namespace_slice_registry.h"
#include "datanode/namespace_slice_storage.h"
#include "datanode/storage-common/async_dir_remover.h"
#include "datanode/storage-common/transition_coordinator.h"

namespace storage {

/**
 * @brief Storage of a datanode: every configured storage root and the
 * namespace slices nested in them.
 *
 * recoverTransitionRead() brings the roots to the current layout once per
 * instance, the namespace variant does the same for the slices of one
 * namespace and attaches them. Locks taken on the way are held until the
 * object is destroyed or unlockAll() is called.
 */
class DataStorage : public TransitionCoordinator {
public:
	explicit DataStorage(IUpgradeManager &upgradeManager);
	~DataStorage() override;

	/**
	 * @brief Probes, recovers and transitions the storage roots.
	 *
	 * Later calls on an initialized storage do nothing.
	 *
	 * @throws StorageException when no root is usable,
	 *         IncorrectVersionException, NamespaceMismatchException or
	 *         InconsistentStateException for a root the namespace cannot
	 *         accept, TransitionFailedException when a worker failed.
	 */
	void recoverTransitionRead(const NamespaceDescriptor &nsInfo,
	                           const std::vector<std::filesystem::path> &dataDirs,
	                           StartupOption option);

	/// Same for the slices of `namespaceId` in `dataDirs`, which get attached
	/// to the registry. A namespace already attached is left as it is.
	void recoverTransitionRead(int32_t namespaceId, const NamespaceDescriptor &nsInfo,
	                           const std::vector<std::filesystem::path> &dataDirs,
	                           StartupOption option);

	/// Finalizes the snapshots of every storage root.
	void finalizeUpgrade();

	/// Finalizes node level snapshots where they exist, the snapshots of the
	/// namespace slices elsewhere.
	void finalizeUpgrade(int32_t namespaceId);

	/// Detaches the slices of `namespaceId`.
	void removeNamespaceStorage(int32_t namespaceId);

	std::shared_ptr<NamespaceSliceStorage> namespaceStorage(int32_t namespaceId) const {
		return registry_.lookup(namespaceId);
	}

	const NamespaceSliceRegistry &registry() const { return registry_; }

	/// Assigns a new storage id unless the node already has one.
	void createStorageId(uint16_t port);

	const std::string &storageId() const { return storageId_; }

	bool isInitialized() const { return initialized_; }

	void requestStop() override;

	/// Blocks until every finalized snapshot is removed.
	void waitForFinalize() { remover_.waitForAll(); }

protected:
	StorageLevel level() const override { return StorageLevel::kNodeLevel; }
	void format(StorageDirectory &directory, const NamespaceDescriptor &nsInfo) override;
	StorageInfo readStorageInfo(const StorageDirectory &directory,
	                            const NamespaceDescriptor &nsInfo) override;
	void writeStorageInfo(const StorageDirectory &directory, const StorageInfo &info) override;
	bool isNamespaceIdChecked(const StorageInfo &info) const override;

private:
	/// Writes the version records and poisons the legacy marker of every root.
	void writeAll();

	std::string storageId_;
	bool initialized_ = false;
	NamespaceSliceRegistry registry_;
	AsyncDirectoryRemover remover_;
};

}  // namespace storage
