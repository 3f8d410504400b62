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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "datanode/storage-common/storage_exceptions.h"
#include "datanode/storage-common/transition_workers.h"
#include "datanode/storage-common/version_record.h"
#include "unittests/temporary_directory.h"

using namespace storage;
using ::testing::HasSubstr;
using unittests::readFile;
using unittests::snapshotTree;
using unittests::writeFile;

namespace {

constexpr int32_t kNamespaceId = 7;

}  // namespace

class TransitionWorkersTest : public ::testing::Test {
protected:
	TransitionWorkersTest()
	    : scratch_("transition_workers_test"),
	      root_(scratch_.path() / "dn1"),
	      directory_(root_),
	      nsInfo_{kNamespaceId, kCurrentLayoutVersion, 100} {}

	/// Storage root written by a federation-era datanode with one slice.
	void makeFederationRoot(LayoutVersion layoutVersion) {
		auto current = root_ / kCurrentDirName;
		fs::create_directories(current);
		VersionRecordCodec::write(current / kVersionFileName,
		                          FederationRecord{layoutVersion, "DS-1-10.0.0.1-9866-1"});
		writeFile(current / "blk_1", "block one");
		writeFile(current / "blk_1_1001.meta", "meta one");
		writeFile(current / "subdir0" / "blk_2", "block two");

		auto sliceCurrent = current / namespaceDirName(kNamespaceId) / kCurrentDirName;
		fs::create_directories(sliceCurrent);
		VersionRecordCodec::write(sliceCurrent / kVersionFileName,
		                          NamespaceSliceRecord{layoutVersion, kNamespaceId, 100});
		writeFile(sliceCurrent / "blk_9", "block nine");
	}

	unittests::TemporaryDirectory scratch_;
	fs::path root_;
	StorageDirectory directory_;
	NamespaceDescriptor nsInfo_;
};

TEST_F(TransitionWorkersTest, UpgradeThenRollbackRestoresCurrent) {
	makeFederationRoot(kFederationLayoutVersion);
	auto before = snapshotTree(directory_.currentDir());

	UpgradeWorker upgrade(directory_, StorageLevel::kNodeLevel,
	                      StorageInfo{kFederationLayoutVersion, kNamespaceId, 0}, nsInfo_);
	upgrade.run();

	ASSERT_TRUE(fs::exists(directory_.previousTmpDir()));
	EXPECT_TRUE(fs::equivalent(directory_.previousTmpDir() / "blk_1",
	                           directory_.currentDir() / "blk_1"));
	EXPECT_TRUE(fs::equivalent(directory_.previousTmpDir() / "NS-7" / "current" / "blk_9",
	                           directory_.currentDir() / "NS-7" / "current" / "blk_9"));
	// The node record only appears when the upgrade is committed, the slice
	// record is carried over as a copy.
	EXPECT_FALSE(fs::exists(directory_.versionFile()));
	EXPECT_FALSE(directory_.hasCurrentVersion());
	EXPECT_FALSE(fs::equivalent(directory_.previousTmpDir() / "NS-7" / "current" / kVersionFileName,
	                            directory_.currentDir() / "NS-7" / "current" / kVersionFileName));
	EXPECT_EQ(upgrade.statistics().multiLinkOperations, 3U);
	auto withoutNodeRecord = before;
	withoutNodeRecord.erase(kVersionFileName);
	EXPECT_EQ(snapshotTree(directory_.currentDir()), withoutNodeRecord);

	fs::rename(directory_.previousTmpDir(), directory_.previousDir());
	VersionRecordCodec::write(directory_.versionFile(),
	                          FederationRecord{kCurrentLayoutVersion, "DS-1-10.0.0.1-9866-1"});

	RollbackWorker rollback(directory_, StorageLevel::kNodeLevel, nsInfo_);
	rollback.run();

	EXPECT_TRUE(rollback.rolledBack());
	EXPECT_FALSE(fs::exists(directory_.previousDir()));
	EXPECT_FALSE(fs::exists(directory_.removedTmpDir()));
	EXPECT_EQ(snapshotTree(directory_.currentDir()), before);
}

TEST_F(TransitionWorkersTest, PreFederationUpgradeMovesBlocksIntoSlice) {
	auto current = root_ / kCurrentDirName;
	fs::create_directories(current);
	VersionRecordCodec::write(current / kVersionFileName,
	                          PreFederationRecord{-18, "DS-1-10.0.0.1-9866-1", kNamespaceId, 100});
	writeFile(current / "blk_1", "block one");
	writeFile(current / "subdir0" / "blk_2", "block two");

	UpgradeWorker upgrade(directory_, StorageLevel::kNodeLevel,
	                      StorageInfo{-18, kNamespaceId, 100}, nsInfo_);
	upgrade.run();

	auto sliceCurrent = current / "NS-7" / kCurrentDirName;
	EXPECT_TRUE(fs::equivalent(directory_.previousTmpDir() / "blk_1", sliceCurrent / "blk_1"));
	EXPECT_TRUE(fs::equivalent(directory_.previousTmpDir() / "subdir0" / "blk_2",
	                           sliceCurrent / "subdir0" / "blk_2"));
	EXPECT_FALSE(fs::exists(current / "blk_1"));
	EXPECT_EQ(VersionRecordCodec::readSlice(sliceCurrent / kVersionFileName),
	          (NamespaceSliceRecord{kCurrentLayoutVersion, kNamespaceId, 100}));
	// The snapshot keeps the old record untouched.
	EXPECT_EQ(layoutVersionOf(VersionRecordCodec::readNode(directory_.previousTmpDir() /
	                                                       kVersionFileName)),
	          -18);
}

TEST_F(TransitionWorkersTest, UpgradeRefusedWhileSliceSnapshotExists) {
	makeFederationRoot(kFederationLayoutVersion);
	fs::create_directories(directory_.currentDir() / "NS-7" / kPreviousDirName);

	UpgradeWorker upgrade(directory_, StorageLevel::kNodeLevel,
	                      StorageInfo{kFederationLayoutVersion, kNamespaceId, 0}, nsInfo_);
	try {
		upgrade.run();
		FAIL() << "upgrade should be refused";
	} catch (const InconsistentStateException &e) {
		EXPECT_THAT(e.what(), HasSubstr("Local snapshot exists"));
	}
	EXPECT_TRUE(directory_.hasCurrentVersion());
	EXPECT_FALSE(fs::exists(directory_.previousTmpDir()));
}

TEST_F(TransitionWorkersTest, NamespaceUpgradeReplacesOldSnapshot) {
	makeFederationRoot(kCurrentLayoutVersion);
	StorageDirectory slice(directory_.currentDir() / "NS-7");
	writeFile(slice.previousDir() / "blk_old", "stale snapshot");

	UpgradeWorker upgrade(slice, StorageLevel::kNamespaceLevel,
	                      StorageInfo{kCurrentLayoutVersion, kNamespaceId, 50}, nsInfo_);
	upgrade.run();

	EXPECT_FALSE(fs::exists(slice.previousDir()));
	EXPECT_TRUE(fs::equivalent(slice.previousTmpDir() / "blk_9", slice.currentDir() / "blk_9"));
	EXPECT_EQ(upgrade.statistics().filesInMultiLinks, 1U);
	EXPECT_EQ(upgrade.statistics().physicalCopies, 0U);
	EXPECT_FALSE(slice.hasCurrentVersion());
}

TEST_F(TransitionWorkersTest, RollbackWithoutSnapshotDoesNothing) {
	makeFederationRoot(kCurrentLayoutVersion);
	auto before = snapshotTree(root_);

	RollbackWorker rollback(directory_, StorageLevel::kNodeLevel, nsInfo_);
	rollback.run();

	EXPECT_FALSE(rollback.rolledBack());
	EXPECT_EQ(snapshotTree(root_), before);
}

TEST_F(TransitionWorkersTest, NodeRollbackToNewerLayoutIsRejected) {
	makeFederationRoot(kCurrentLayoutVersion);
	fs::create_directories(directory_.previousDir());
	VersionRecordCodec::write(directory_.previousVersionFile(),
	                          FederationRecord{kCurrentLayoutVersion - 1, "DS-1-10.0.0.1-9866-1"});
	auto before = snapshotTree(root_);

	RollbackWorker rollback(directory_, StorageLevel::kNodeLevel, nsInfo_);
	try {
		rollback.run();
		FAIL() << "rollback should be refused";
	} catch (const InconsistentStateException &e) {
		EXPECT_THAT(e.what(), HasSubstr("Cannot rollback to a newer state"));
	}
	EXPECT_FALSE(rollback.rolledBack());
	EXPECT_EQ(snapshotTree(root_), before);
}

TEST_F(TransitionWorkersTest, NamespaceRollbackToNewerCreationTimeIsRejected) {
	makeFederationRoot(kCurrentLayoutVersion);
	StorageDirectory slice(directory_.currentDir() / "NS-7");
	fs::create_directories(slice.previousDir());
	VersionRecordCodec::write(slice.previousVersionFile(),
	                          NamespaceSliceRecord{kCurrentLayoutVersion, kNamespaceId, 200});

	RollbackWorker rollback(slice, StorageLevel::kNamespaceLevel, nsInfo_);
	EXPECT_THROW(rollback.run(), InconsistentStateException);
	EXPECT_TRUE(fs::exists(slice.previousDir()));
	EXPECT_EQ(readFile(slice.currentDir() / "blk_9"), "block nine");
}

TEST_F(TransitionWorkersTest, NamespaceRollbackRestoresOlderSlice) {
	makeFederationRoot(kCurrentLayoutVersion);
	StorageDirectory slice(directory_.currentDir() / "NS-7");
	writeFile(slice.previousDir() / "blk_8", "block eight");
	VersionRecordCodec::write(slice.previousVersionFile(),
	                          NamespaceSliceRecord{kCurrentLayoutVersion, kNamespaceId, 50});

	RollbackWorker rollback(slice, StorageLevel::kNamespaceLevel, nsInfo_);
	rollback.run();

	EXPECT_TRUE(rollback.rolledBack());
	EXPECT_EQ(readFile(slice.currentDir() / "blk_8"), "block eight");
	EXPECT_FALSE(fs::exists(slice.currentDir() / "blk_9"));
	EXPECT_EQ(VersionRecordCodec::readSlice(slice.versionFile()).creationTime, 50);
}

TEST_F(TransitionWorkersTest, FinalizeRemovesSnapshot) {
	makeFederationRoot(kCurrentLayoutVersion);
	writeFile(directory_.previousDir() / "blk_1", "old block");
	AsyncDirectoryRemover remover;
	StorageInfo info{kCurrentLayoutVersion, kNamespaceId, 0};

	EXPECT_TRUE(finalizeDirectory(directory_, info, remover));
	remover.waitForAll();

	EXPECT_EQ(remover.scheduled(), 1U);
	EXPECT_FALSE(fs::exists(directory_.previousDir()));
	EXPECT_FALSE(fs::exists(directory_.finalizedTmpDir()));
	EXPECT_EQ(readFile(directory_.currentDir() / "blk_1"), "block one");

	EXPECT_FALSE(finalizeDirectory(directory_, info, remover));
	EXPECT_EQ(remover.scheduled(), 1U);
}

TEST_F(TransitionWorkersTest, WaitingReleasesFinishedRemovals) {
	AsyncDirectoryRemover remover;
	for (int i = 0; i < 3; ++i) {
		auto doomed = scratch_.path() / ("doomed" + std::to_string(i));
		writeFile(doomed / "blk_1", "block one");
		remover.remove(doomed, "dn" + std::to_string(i));
	}
	EXPECT_EQ(remover.pending(), 3U);
	remover.waitForAll();
	EXPECT_EQ(remover.pending(), 0U);

	writeFile(scratch_.path() / "doomed3" / "blk_1", "block one");
	remover.remove(scratch_.path() / "doomed3", "dn3");
	remover.waitForAll();

	EXPECT_EQ(remover.scheduled(), 4U);
	EXPECT_EQ(remover.pending(), 0U);
	for (int i = 0; i < 4; ++i) {
		EXPECT_FALSE(fs::exists(scratch_.path() / ("doomed" + std::to_string(i))));
	}
}

TEST(StorageLevelTests, ToString) {
	EXPECT_EQ(toString(StorageLevel::kNodeLevel), "node");
	EXPECT_EQ(toString(StorageLevel::kNamespaceLevel), "namespace");
}
