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

#include "datanode/namespace_slice_storage.h"
#include "datanode/storage-common/storage_exceptions.h"
#include "datanode/storage-common/version_record.h"
#include "unittests/mocks/upgrade_manager_mock.h"
#include "unittests/temporary_directory.h"

using namespace storage;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using unittests::readFile;
using unittests::writeFile;

namespace {

constexpr int32_t kNamespaceId = 7;

}  // namespace

class NamespaceSliceStorageTest : public ::testing::Test {
protected:
	NamespaceSliceStorageTest()
	    : scratch_("namespace_slice_storage_test"),
	      roots_{scratch_.path() / "dn1", scratch_.path() / "dn2"},
	      storage_(kNamespaceId, upgradeManager_) {
		for (const auto &root : roots_) {
			fs::create_directories(root);
		}
	}

	fs::path sliceCurrent(const fs::path &root) {
		return root / kCurrentDirName / namespaceDirName(kNamespaceId) / kCurrentDirName;
	}

	/// Slice written by an earlier run of the namespace.
	void makeSlice(const fs::path &root, int64_t creationTime,
	               int32_t namespaceId = kNamespaceId) {
		auto current = sliceCurrent(root);
		fs::create_directories(current);
		VersionRecordCodec::write(current / kVersionFileName,
		                          NamespaceSliceRecord{kCurrentLayoutVersion, namespaceId,
		                                               creationTime});
		writeFile(current / "blk_9", "block nine");
	}

	static NamespaceDescriptor nsInfo(int64_t creationTime) {
		return NamespaceDescriptor{kNamespaceId, kCurrentLayoutVersion, creationTime};
	}

	unittests::TemporaryDirectory scratch_;
	std::vector<fs::path> roots_;
	NiceMock<UpgradeManagerMock> upgradeManager_;
	NamespaceSliceStorage storage_;
};

TEST_F(NamespaceSliceStorageTest, SliceRoot) {
	EXPECT_EQ(storage_.sliceRoot("/data/dn1"), fs::path("/data/dn1/current/NS-7"));
}

TEST_F(NamespaceSliceStorageTest, FormatsMissingSlices) {
	ASSERT_TRUE(storage_.recoverTransitionRead(nsInfo(100), roots_, StartupOption::kRegular));

	ASSERT_EQ(storage_.directories().size(), 2U);
	for (const auto &root : roots_) {
		EXPECT_EQ(VersionRecordCodec::readSlice(sliceCurrent(root) / kVersionFileName),
		          (NamespaceSliceRecord{kCurrentLayoutVersion, kNamespaceId, 100}));
	}
	for (const auto &result : storage_.lastTransitionResults()) {
		EXPECT_EQ(result.kind, TransitionResult::Kind::kFormatted);
	}
	EXPECT_EQ(storage_.storageInfo(),
	          (StorageInfo{kCurrentLayoutVersion, kNamespaceId, 100}));
}

TEST_F(NamespaceSliceStorageTest, RegularStartKeepsSlices) {
	makeSlice(roots_[0], 100);
	makeSlice(roots_[1], 100);
	EXPECT_CALL(upgradeManager_, verifyDistributedUpgradeProgress(_)).Times(0);

	ASSERT_TRUE(storage_.recoverTransitionRead(nsInfo(100), roots_, StartupOption::kRegular));

	for (const auto &result : storage_.lastTransitionResults()) {
		EXPECT_EQ(result.kind, TransitionResult::Kind::kUnchanged);
	}
	EXPECT_FALSE(fs::exists(sliceCurrent(roots_[0]).parent_path() / kPreviousDirName));
}

TEST_F(NamespaceSliceStorageTest, MismatchedNamespaceDescriptor) {
	NamespaceDescriptor other{kNamespaceId + 1, kCurrentLayoutVersion, 100};

	EXPECT_THROW(storage_.recoverTransitionRead(other, roots_, StartupOption::kRegular),
	             NamespaceMismatchException);
}

TEST_F(NamespaceSliceStorageTest, SliceOfAnotherNamespace) {
	makeSlice(roots_[0], 100, kNamespaceId + 1);

	try {
		storage_.recoverTransitionRead(nsInfo(100), {roots_[0]}, StartupOption::kRegular);
		FAIL() << "a slice of another namespace should be refused";
	} catch (const NamespaceMismatchException &e) {
		EXPECT_THAT(e.what(), HasSubstr("Incompatible namespaceIDs"));
	}
}

TEST_F(NamespaceSliceStorageTest, UpgradeThenRollback) {
	makeSlice(roots_[0], 50);
	makeSlice(roots_[1], 50);
	EXPECT_CALL(upgradeManager_, verifyDistributedUpgradeProgress(_)).Times(2);

	ASSERT_TRUE(storage_.recoverTransitionRead(nsInfo(100), roots_, StartupOption::kRegular));

	for (const auto &result : storage_.lastTransitionResults()) {
		EXPECT_EQ(result.kind, TransitionResult::Kind::kUpgraded);
	}
	auto sliceRoot = storage_.sliceRoot(roots_[0]);
	EXPECT_EQ(VersionRecordCodec::readSlice(sliceRoot / kPreviousDirName / kVersionFileName)
	              .creationTime,
	          50);
	EXPECT_EQ(VersionRecordCodec::readSlice(sliceCurrent(roots_[0]) / kVersionFileName)
	              .creationTime,
	          100);
	EXPECT_TRUE(fs::equivalent(sliceRoot / kPreviousDirName / "blk_9",
	                           sliceCurrent(roots_[0]) / "blk_9"));

	storage_.unlockAll();
	NiceMock<UpgradeManagerMock> upgradeManager;
	NamespaceSliceStorage rollback(kNamespaceId, upgradeManager);
	ASSERT_TRUE(rollback.recoverTransitionRead(nsInfo(50), roots_, StartupOption::kRollback));

	for (const auto &result : rollback.lastTransitionResults()) {
		EXPECT_EQ(result.kind, TransitionResult::Kind::kRolledBack);
	}
	for (const auto &root : roots_) {
		EXPECT_EQ(VersionRecordCodec::readSlice(sliceCurrent(root) / kVersionFileName),
		          (NamespaceSliceRecord{kCurrentLayoutVersion, kNamespaceId, 50}));
		EXPECT_FALSE(fs::exists(rollback.sliceRoot(root) / kPreviousDirName));
		EXPECT_EQ(readFile(sliceCurrent(root) / "blk_9"), "block nine");
	}
}

TEST_F(NamespaceSliceStorageTest, FinalizeOneRoot) {
	makeSlice(roots_[0], 50);
	makeSlice(roots_[1], 50);
	ASSERT_TRUE(storage_.recoverTransitionRead(nsInfo(100), roots_, StartupOption::kRegular));

	AsyncDirectoryRemover remover;
	EXPECT_TRUE(storage_.finalize(roots_[0] / kCurrentDirName, remover));
	remover.waitForAll();

	EXPECT_FALSE(fs::exists(storage_.sliceRoot(roots_[0]) / kPreviousDirName));
	EXPECT_TRUE(fs::exists(storage_.sliceRoot(roots_[1]) / kPreviousDirName));
	EXPECT_FALSE(storage_.finalize(roots_[0] / kCurrentDirName, remover));
	EXPECT_FALSE(storage_.finalize(scratch_.path() / "unknown" / kCurrentDirName, remover));
	EXPECT_EQ(storage_.finalizeAll(remover), 1);
}

TEST_F(NamespaceSliceStorageTest, NewerSliceIsRejected) {
	makeSlice(roots_[0], 200);

	try {
		storage_.recoverTransitionRead(nsInfo(100), {roots_[0]}, StartupOption::kRegular);
		FAIL() << "a slice newer than the namespace should be refused";
	} catch (const InconsistentStateException &e) {
		EXPECT_THAT(e.what(), HasSubstr("is newer than the namespace state"));
	}
	EXPECT_EQ(readFile(sliceCurrent(roots_[0]) / "blk_9"), "block nine");
}

TEST_F(NamespaceSliceStorageTest, RollbackToNewerCreationTimeIsRejected) {
	makeSlice(roots_[0], 100);
	auto previous = storage_.sliceRoot(roots_[0]) / kPreviousDirName;
	fs::create_directories(previous);
	VersionRecordCodec::write(previous / kVersionFileName,
	                          NamespaceSliceRecord{kCurrentLayoutVersion, kNamespaceId, 150});

	EXPECT_THROW(
	    storage_.recoverTransitionRead(nsInfo(100), {roots_[0]}, StartupOption::kRollback),
	    TransitionFailedException);
	EXPECT_TRUE(fs::exists(previous));
	ASSERT_EQ(storage_.lastTransitionResults().size(), 1U);
	EXPECT_EQ(storage_.lastTransitionResults()[0].kind, TransitionResult::Kind::kFailed);
	EXPECT_THAT(storage_.lastTransitionResults()[0].cause,
	            HasSubstr("Cannot rollback to a newer state"));
}
