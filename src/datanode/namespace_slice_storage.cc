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
#include "datanode/namespace_slice_storage.h"

#include <fmt/format.h>

#include "datanode/storage-common/storage_exceptions.h"
#include "datanode/storage-common/version_record.h"
#include "errors/kestrelfs_error_codes.h"
#include "slogger/slogger.h"

namespace storage {

NamespaceSliceStorage::NamespaceSliceStorage(int32_t namespaceId, IUpgradeManager &upgradeManager)
    : TransitionCoordinator(upgradeManager), namespaceId_(namespaceId) {
	info_.namespaceId = namespaceId;
}

std::filesystem::path NamespaceSliceStorage::sliceRoot(
    const std::filesystem::path &storageRoot) const {
	return storageRoot / kCurrentDirName / namespaceDirName(namespaceId_);
}

bool NamespaceSliceStorage::recoverTransitionRead(
    const NamespaceDescriptor &nsInfo, const std::vector<std::filesystem::path> &storageRoots,
    StartupOption option) {
	if (nsInfo.namespaceId != namespaceId_) {
		throw NamespaceMismatchException(
		    fmt::format("namespace {} handed to the storage of namespace {}",
		                nsInfo.namespaceId, namespaceId_),
		    KESTRELFS_ERROR_EINVAL);
	}

	std::vector<std::filesystem::path> sliceRoots;
	for (const auto &storageRoot : storageRoots) {
		auto slice = sliceRoot(storageRoot);
		std::error_code errorCode;
		std::filesystem::create_directories(slice, errorCode);
		if (errorCode) {
			// Probing reports it as a missing directory.
			ksfs::log_warn("Invalid directory in: {}: {}", slice.string(), errorCode.message());
		}
		sliceRoots.push_back(std::move(slice));
	}

	probeDirectories(sliceRoots, nsInfo, option);
	if (!doTransition(nsInfo, option)) {
		return false;
	}

	info_ = StorageInfo{kCurrentLayoutVersion, namespaceId_, nsInfo.creationTime};
	for (const auto &directory : directories()) {
		writeStorageInfo(*directory, info_);
	}
	return true;
}

bool NamespaceSliceStorage::finalize(const std::filesystem::path &nodeCurrentDir,
                                     AsyncDirectoryRemover &remover) {
	StorageDirectory probe(nodeCurrentDir / namespaceDirName(namespaceId_));
	for (const auto &directory : directories()) {
		if (directory->root() == probe.root()) {
			return finalizeDirectory(*directory, info_, remover);
		}
	}
	ksfs::log_warn("{} is not a slice of namespace {}", probe.root().string(), namespaceId_);
	return false;
}

void NamespaceSliceStorage::format(StorageDirectory &directory,
                                   const NamespaceDescriptor &nsInfo) {
	directory.clearDirectory();
	info_ = StorageInfo{kCurrentLayoutVersion, namespaceId_, nsInfo.creationTime};
	writeStorageInfo(directory, info_);
}

StorageInfo NamespaceSliceStorage::readStorageInfo(const StorageDirectory &directory,
                                                   const NamespaceDescriptor & /*nsInfo*/) {
	auto record = VersionRecordCodec::readSlice(directory.versionFile());
	return StorageInfo{record.layoutVersion, record.namespaceId, record.creationTime};
}

void NamespaceSliceStorage::writeStorageInfo(const StorageDirectory &directory,
                                             const StorageInfo &info) {
	VersionRecordCodec::write(
	    directory.versionFile(),
	    NamespaceSliceRecord{info.layoutVersion, info.namespaceId, info.creationTime});
}

bool NamespaceSliceStorage::isUpgradeRequired(const StorageInfo &info,
                                              const NamespaceDescriptor &nsInfo) const {
	return TransitionCoordinator::isUpgradeRequired(info, nsInfo) ||
	       info.creationTime < nsInfo.creationTime;
}

}  // namespace storage
