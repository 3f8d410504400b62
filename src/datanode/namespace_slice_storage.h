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
#include <vector>

#include "datanode/storage-common/transition_coordinator.h"

namespace storage {

/**
 * @brief Storage of one namespace: the slices current/NS-<id> nested in the
 * storage roots of the node.
 *
 * Every slice keeps its own version record and its own snapshot, so a
 * namespace can be upgraded, rolled back or finalized on its own. A slice is
 * upgraded when its layout is older or its creation time is behind the
 * namespace.
 */
class NamespaceSliceStorage : public TransitionCoordinator {
public:
	NamespaceSliceStorage(int32_t namespaceId, IUpgradeManager &upgradeManager);

	int32_t namespaceId() const { return namespaceId_; }

	/// Slice root of this namespace inside a storage root.
	std::filesystem::path sliceRoot(const std::filesystem::path &storageRoot) const;

	/**
	 * @brief Brings the slices of every storage root to the namespace state.
	 *
	 * Missing slice directories are created first. Returns false when an
	 * interrupted rollback left the slices as they were.
	 */
	bool recoverTransitionRead(const NamespaceDescriptor &nsInfo,
	                           const std::vector<std::filesystem::path> &storageRoots,
	                           StartupOption option);

	/// Finalizes the slice nested in `nodeCurrentDir` (a storage root's
	/// current directory). Returns false when it has no snapshot.
	bool finalize(const std::filesystem::path &nodeCurrentDir, AsyncDirectoryRemover &remover);

protected:
	StorageLevel level() const override { return StorageLevel::kNamespaceLevel; }
	void format(StorageDirectory &directory, const NamespaceDescriptor &nsInfo) override;
	StorageInfo readStorageInfo(const StorageDirectory &directory,
	                            const NamespaceDescriptor &nsInfo) override;
	void writeStorageInfo(const StorageDirectory &directory, const StorageInfo &info) override;
	bool isNamespaceIdChecked(const StorageInfo & /*info*/) const override { return true; }
	bool isUpgradeRequired(const StorageInfo &info,
	                       const NamespaceDescriptor &nsInfo) const override;

private:
	int32_t namespaceId_;
};

}  // namespace storage
