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
#include "datanode/data_storage.h"

#include <fmt/format.h>

#include "datanode/storage-common/legacy_storage_file.h"
#include "datanode/storage-common/storage_exceptions.h"
#include "datanode/storage-common/storage_utils.h"
#include "datanode/storage-common/version_record.h"
#include "datanode/storage_id.h"
#include "errors/kestrelfs_error_codes.h"
#include "slogger/slogger.h"

namespace storage {

DataStorage::DataStorage(IUpgradeManager &upgradeManager)
    : TransitionCoordinator(upgradeManager) {}

DataStorage::~DataStorage() {
	remover_.waitForAll();
}

void DataStorage::recoverTransitionRead(const NamespaceDescriptor &nsInfo,
                                        const std::vector<std::filesystem::path> &dataDirs,
                                        StartupOption option) {
	if (initialized_) {
		return;
	}
	if (nsInfo.layoutVersion != kCurrentLayoutVersion) {
		ksfs::log_warn("namespace {} reports LV = {}, this build handles LV = {}",
		               nsInfo.namespaceId, nsInfo.layoutVersion, kCurrentLayoutVersion);
	}

	storageId_.clear();
	probeDirectories(dataDirs, nsInfo, option);

	// Each storage root is handled on its own: some may be upgraded or rolled
	// back while the others start regularly.
	if (!doTransition(nsInfo, option)) {
		ksfs::log_warn("Storage transition interrupted, nothing was committed");
		return;
	}

	createStorageId(upgradeManager_.port());

	info_ = StorageInfo{kCurrentLayoutVersion, nsInfo.namespaceId, 0};
	writeAll();
	initialized_ = true;
	ksfs::log_info("Datanode storage {} initialized with {} storage directories", storageId_,
	               directories().size());
}

void DataStorage::recoverTransitionRead(int32_t namespaceId, const NamespaceDescriptor &nsInfo,
                                        const std::vector<std::filesystem::path> &dataDirs,
                                        StartupOption option) {
	if (registry_.lookup(namespaceId) != nullptr) {
		ksfs::log_info("Namespace {} is already attached", namespaceId);
		return;
	}

	auto slice = std::make_shared<NamespaceSliceStorage>(namespaceId, upgradeManager_);
	if (!slice->recoverTransitionRead(nsInfo, dataDirs, option)) {
		ksfs::log_warn("Transition of namespace {} interrupted, not attaching it", namespaceId);
		return;
	}
	registry_.attach(namespaceId, std::move(slice));
	ksfs::log_info("Namespace {} attached", namespaceId);
}

void DataStorage::finalizeUpgrade() {
	int finalized = finalizeAll(remover_);
	ksfs::log_info("Finalizing {} storage directories", finalized);
}

void DataStorage::finalizeUpgrade(int32_t namespaceId) {
	// A snapshot taken at node level while moving to the federation layout
	// takes precedence over the slice snapshots.
	for (const auto &directory : directories()) {
		if (directory->hasPrevious()) {
			finalizeDirectory(*directory, info_, remover_);
			continue;
		}
		auto slice = registry_.lookup(namespaceId);
		if (slice == nullptr) {
			throw StorageException(fmt::format("namespace {} is not attached", namespaceId),
			                       KESTRELFS_ERROR_ENOENT);
		}
		slice->finalize(directory->currentDir(), remover_);
	}
}

void DataStorage::removeNamespaceStorage(int32_t namespaceId) {
	if (registry_.detach(namespaceId)) {
		ksfs::log_info("Namespace {} detached", namespaceId);
	}
}

void DataStorage::createStorageId(uint16_t port) {
	if (!storageId_.empty()) {
		return;
	}
	storageId_ = storage::createStorageId(port);
	ksfs::log_info("Assigned new storage id {}", storageId_);
}

void DataStorage::requestStop() {
	TransitionCoordinator::requestStop();
	for (auto namespaceId : registry_.namespaceIds()) {
		if (auto slice = registry_.lookup(namespaceId)) {
			slice->requestStop();
		}
	}
}

void DataStorage::format(StorageDirectory &directory, const NamespaceDescriptor &nsInfo) {
	directory.clearDirectory();
	for (const auto &name : {kTmpDirName, kBlocksBeingWrittenDirName}) {
		auto path = directory.root() / name;
		throwOnError(removeDirectory(path), "can't remove " + path.string());
		throwOnError(createDirectory(path), "can't create " + path.string());
	}
	info_ = StorageInfo{kCurrentLayoutVersion, nsInfo.namespaceId, 0};
	// Keeps the storage id known so far.
	writeStorageInfo(directory, info_);
}

StorageInfo DataStorage::readStorageInfo(const StorageDirectory &directory,
                                         const NamespaceDescriptor &nsInfo) {
	auto record = VersionRecordCodec::readNode(directory.versionFile());
	reconcileStorageId(storageId_, record, directory.root().string());
	return storageInfoOf(record, StorageInfo{layoutVersionOf(record), nsInfo.namespaceId, 0});
}

void DataStorage::writeStorageInfo(const StorageDirectory &directory, const StorageInfo &info) {
	VersionRecordCodec::write(directory.versionFile(), makeNodeVersionRecord(info, storageId_));
}

bool DataStorage::isNamespaceIdChecked(const StorageInfo &info) const {
	return isPreFederationLayout(info.layoutVersion);
}

void DataStorage::writeAll() {
	for (const auto &directory : directories()) {
		writeStorageInfo(*directory, info_);
		throwOnError(corruptPreUpgradeStorage(directory->root()),
		             "can't write the legacy storage marker of " + directory->root().string());
	}
}

}  // namespace storage
