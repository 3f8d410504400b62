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
#include "datanode/storage-common/transition_workers.h"

#include <algorithm>
#include <vector>

#include <fmt/format.h>

#include "datanode/storage-common/storage_exceptions.h"
#include "datanode/storage-common/storage_utils.h"
#include "datanode/storage-common/version_record.h"
#include "errors/kestrelfs_error_codes.h"
#include "metrics/metrics.h"
#include "slogger/slogger.h"

namespace storage {

namespace {

bool pathExists(const fs::path &path) {
	std::error_code errorCode;
	return fs::exists(path, errorCode);
}

std::vector<fs::path> namespaceDirectories(const fs::path &directory) {
	std::vector<fs::path> result;
	std::error_code errorCode;
	for (fs::directory_iterator it(directory, errorCode), end; !errorCode && it != end;
	     it.increment(errorCode)) {
		auto name = it->path().filename().string();
		if (name.starts_with(kNamespaceDirPrefix) && it->is_directory(errorCode)) {
			result.push_back(it->path());
		}
	}
	if (errorCode) {
		throw StorageException("can't list " + directory.string() + ": " + errorCode.message(),
		                       KESTRELFS_ERROR_IO);
	}
	std::sort(result.begin(), result.end());
	return result;
}

}  // namespace

std::string toString(StorageLevel level) {
	switch (level) {
	case StorageLevel::kNodeLevel:
		return "node";
	case StorageLevel::kNamespaceLevel:
		return "namespace";
	}
	return "unknown";
}

UpgradeWorker::UpgradeWorker(const StorageDirectory &directory, StorageLevel level,
                             StorageInfo oldInfo, NamespaceDescriptor nsInfo)
    : directory_(directory), level_(level), oldInfo_(oldInfo), nsInfo_(nsInfo) {}

void UpgradeWorker::checkSnapshotCoexistence() const {
	for (const auto &namespaceDir : namespaceDirectories(directory_.currentDir())) {
		if (pathExists(namespaceDir / kPreviousDirName)) {
			throw InconsistentStateException(
			    directory_.root().string() +
			    ": Local snapshot exists. Please either finalize or rollback first!");
		}
	}
}

void UpgradeWorker::run() {
	const auto rootName = directory_.root().string();
	// Global and per namespace snapshots cannot coexist.
	if (level_ == StorageLevel::kNodeLevel) {
		checkSnapshotCoexistence();
	}

	ksfs::log_info("Upgrading {} storage directory {}: old LV = {}; old CTime = {}, "
	               "new LV = {}; new CTime = {}",
	               toString(level_), rootName, oldInfo_.layoutVersion, oldInfo_.creationTime,
	               nsInfo_.layoutVersion, nsInfo_.creationTime);

	if (directory_.hasPrevious()) {
		throwOnError(removeDirectory(directory_.previousDir()),
		             "can't remove old snapshot of " + rootName);
	}
	if (pathExists(directory_.previousTmpDir())) {
		throw InconsistentStateException(rootName + ": " + kPreviousTmpDirName +
		                                 " directory must not exist");
	}
	throwOnError(renameDirectory(directory_.currentDir(), directory_.previousTmpDir()),
	             "can't move current of " + rootName + " aside");

	HardLinkMigrator migrator(oldInfo_.layoutVersion);
	if (level_ == StorageLevel::kNodeLevel) {
		linkNodeLevel(migrator);
	} else {
		migrator.linkBlocks(directory_.previousTmpDir(), directory_.currentDir(), true);
	}
	statistics_ = migrator.statistics();

	metrics::Counter::increment(metrics::Counter::HARD_LINKS,
	                            statistics_.singleLinks + statistics_.filesInMultiLinks);
	metrics::Counter::increment(metrics::Counter::PHYSICAL_COPIES, statistics_.physicalCopies);
	ksfs::log_info("Completed upgrading storage directory {} {}", rootName,
	               statistics_.report());
}

void UpgradeWorker::linkNodeLevel(HardLinkMigrator &migrator) {
	const auto tmpDir = directory_.previousTmpDir();
	const auto currentDir = directory_.currentDir();

	if (isPreFederationLayout(oldInfo_.layoutVersion)) {
		// Every block belonged to the single namespace, move them to its slice.
		const auto sliceCurrent =
		    currentDir / namespaceDirName(nsInfo_.namespaceId) / kCurrentDirName;
		std::error_code errorCode;
		fs::create_directories(sliceCurrent, errorCode);
		if (errorCode) {
			throw StorageException("can't create " + sliceCurrent.string() + ": " +
			                           errorCode.message(),
			                       KESTRELFS_ERROR_CANTCREATEPATH);
		}
		migrator.linkBlocks(tmpDir, sliceCurrent, false);
		VersionRecordCodec::write(
		    sliceCurrent / kVersionFileName,
		    NamespaceSliceRecord{kCurrentLayoutVersion, nsInfo_.namespaceId,
		                         nsInfo_.creationTime});
		return;
	}

	migrator.linkBlocks(tmpDir, currentDir, true);
	for (const auto &namespaceDir : namespaceDirectories(tmpDir)) {
		auto sliceSource = namespaceDir / kCurrentDirName;
		if (!pathExists(sliceSource)) {
			ksfs::log_warn("{} has no {} directory, skipping", namespaceDir.string(),
			               kCurrentDirName);
			continue;
		}
		auto sliceRoot = currentDir / namespaceDir.filename();
		throwOnError(createDirectory(sliceRoot), "can't create " + sliceRoot.string());
		migrator.linkBlocks(sliceSource, sliceRoot / kCurrentDirName, true);
		// Slice records carry over, the node record is written on commit.
		auto sliceVersion = sliceSource / kVersionFileName;
		if (pathExists(sliceVersion)) {
			throwOnError(copyFile(sliceVersion, sliceRoot / kCurrentDirName / kVersionFileName),
			             "can't copy " + sliceVersion.string());
		}
	}
}

RollbackWorker::RollbackWorker(const StorageDirectory &directory, StorageLevel level,
                               NamespaceDescriptor nsInfo)
    : directory_(directory), level_(level), nsInfo_(nsInfo) {}

StorageInfo RollbackWorker::readPreviousState() const {
	if (level_ == StorageLevel::kNodeLevel) {
		auto record = VersionRecordCodec::readNode(directory_.previousVersionFile());
		return storageInfoOf(record, StorageInfo{layoutVersionOf(record), nsInfo_.namespaceId, 0});
	}
	auto record = VersionRecordCodec::readSlice(directory_.previousVersionFile());
	return StorageInfo{record.layoutVersion, record.namespaceId, record.creationTime};
}

void RollbackWorker::run() {
	if (!directory_.hasPrevious()) {
		return;
	}
	const auto rootName = directory_.root().string();
	auto previous = readPreviousState();

	// The snapshot has to be consistent with the namespace or upgradable to it.
	bool newerThanNamespace = level_ == StorageLevel::kNodeLevel
	                              ? previous.layoutVersion < kCurrentLayoutVersion
	                              : previous.creationTime > nsInfo_.creationTime;
	if (newerThanNamespace) {
		throw InconsistentStateException(fmt::format(
		    "{}: Cannot rollback to a newer state. Datanode previous state: {} is newer than "
		    "the namespace state: {}",
		    rootName, describeState(previous.layoutVersion, previous.creationTime),
		    describeState(nsInfo_.layoutVersion, nsInfo_.creationTime)));
	}

	ksfs::log_info("Rolling back {} storage directory {}: target LV = {}; target CTime = {}",
	               toString(level_), rootName, previous.layoutVersion, previous.creationTime);
	if (pathExists(directory_.removedTmpDir())) {
		throw InconsistentStateException(rootName + ": " + kRemovedTmpDirName +
		                                 " directory must not exist");
	}
	throwOnError(renameDirectory(directory_.currentDir(), directory_.removedTmpDir()),
	             "can't move current of " + rootName + " aside");
	throwOnError(renameDirectory(directory_.previousDir(), directory_.currentDir()),
	             "can't restore snapshot of " + rootName);
	throwOnError(removeDirectory(directory_.removedTmpDir()),
	             "can't remove rolled back state of " + rootName);

	rolledBack_ = true;
	metrics::Counter::increment(metrics::Counter::DIRS_ROLLED_BACK);
	ksfs::log_info("Rollback of {} is complete.", rootName);
}

bool finalizeDirectory(const StorageDirectory &directory, const StorageInfo &info,
                       AsyncDirectoryRemover &remover) {
	if (!directory.hasPrevious()) {
		return false;  // already discarded
	}
	const auto rootName = directory.root().string();
	ksfs::log_info("Finalizing upgrade for storage directory {}: cur LV = {}; cur CTime = {}",
	               rootName, info.layoutVersion, info.creationTime);
	throwOnError(renameDirectory(directory.previousDir(), directory.finalizedTmpDir()),
	             "can't finalize " + rootName);
	remover.remove(directory.finalizedTmpDir(), rootName);
	metrics::Counter::increment(metrics::Counter::DIRS_FINALIZED);
	return true;
}

}  // namespace storage
