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

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

#include "datanode/data_storage.h"
#include "datanode/storage-common/legacy_storage_file.h"
#include "datanode/storage-common/storage_exceptions.h"
#include "datanode/storage-common/version_record.h"
#include "unittests/mocks/upgrade_manager_mock.h"
#include "unittests/temporary_directory.h"

using namespace storage;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StartsWith;
using unittests::readFile;
using unittests::snapshotTree;
using unittests::writeFile;

namespace {

constexpr int32_t kNamespaceId = 7;
constexpr int64_t kCreationTime = 100;
const std::string kOldStorageId = "DS-1234-10.0.0.1-9866-1700000000000";

}  // namespace

class DataStorageTest : public ::testing::Test {
protected:
	DataStorageTest()
	    : scratch_("data_storage_test"),
	      roots_{scratch_.path() / "dn1", scratch_.path() / "dn2"},
	      nsInfo_{kNamespaceId, kCurrentLayoutVersion, kCreationTime} {
		ON_CALL(upgradeManager_, port()).WillByDefault(Return(kDefaultDatanodePort));
	}

	/// Storage root of a datanode that predates the federation layout.
	void makePreFederationRoot(const fs::path &root, LayoutVersion layoutVersion = -18,
	                           int32_t namespaceId = kNamespaceId) {
		auto current = root / kCurrentDirName;
		fs::create_directories(current);
		VersionRecordCodec::write(current / kVersionFileName,
		                          PreFederationRecord{layoutVersion, kOldStorageId, namespaceId,
		                                              kCreationTime});
		writeFile(current / "blk_1", "block one");
		writeFile(current / "blk_1_1001.meta", "meta one");
		writeFile(current / "subdir0" / "blk_2", "block two");
	}

	void makeFederationRoot(const fs::path &root, LayoutVersion layoutVersion) {
		auto current = root / kCurrentDirName;
		fs::create_directories(current);
		VersionRecordCodec::write(current / kVersionFileName,
		                          FederationRecord{layoutVersion, kOldStorageId});
		writeFile(current / "blk_1", "block one");
	}

	/// Adds a block subdirectory and one namespace slice to a federation root.
	void addSliceBlocks(const fs::path &root, LayoutVersion layoutVersion) {
		auto current = root / kCurrentDirName;
		writeFile(current / "subdir0" / "blk_2", "block two");
		auto sliceCurrent = current / "NS-7" / kCurrentDirName;
		fs::create_directories(sliceCurrent);
		VersionRecordCodec::write(sliceCurrent / kVersionFileName,
		                          NamespaceSliceRecord{layoutVersion, kNamespaceId, kCreationTime});
		writeFile(sliceCurrent / "blk_9", "block nine");
	}

	/// A staged copy that can't be copied, the upgrade of its root fails.
	static void plantUncopyableFile(const fs::path &directory) {
		ASSERT_EQ(::mkfifo((directory / "dncp_fifo").c_str(), 0600), 0);
	}

	unittests::TemporaryDirectory scratch_;
	std::vector<fs::path> roots_;
	NamespaceDescriptor nsInfo_;
	NiceMock<UpgradeManagerMock> upgradeManager_;
};

TEST_F(DataStorageTest, FormatsEmptyRootAndSkipsMissingOne) {
	fs::create_directories(roots_[0]);
	DataStorage storage(upgradeManager_);

	storage.recoverTransitionRead(nsInfo_, roots_, StartupOption::kRegular);

	EXPECT_TRUE(storage.isInitialized());
	ASSERT_EQ(storage.directories().size(), 1U);
	const auto &results = storage.lastTransitionResults();
	ASSERT_EQ(results.size(), 2U);
	EXPECT_EQ(results[0].kind, TransitionResult::Kind::kFormatted);
	EXPECT_EQ(results[1].kind, TransitionResult::Kind::kFailed);
	EXPECT_EQ(results[1].cause, "does not exist");
	EXPECT_FALSE(fs::exists(roots_[1]));

	EXPECT_THAT(storage.storageId(), StartsWith("DS-"));
	EXPECT_THAT(storage.storageId(), HasSubstr("-9866-"));
	EXPECT_EQ(VersionRecordCodec::readNode(roots_[0] / kCurrentDirName / kVersionFileName),
	          NodeVersionRecord(FederationRecord{kCurrentLayoutVersion, storage.storageId()}));
	EXPECT_TRUE(fs::is_directory(roots_[0] / kTmpDirName));
	EXPECT_TRUE(fs::is_directory(roots_[0] / kBlocksBeingWrittenDirName));
	EXPECT_TRUE(fs::exists(roots_[0] / kLegacyStorageFileName));
	EXPECT_FALSE(isConversionNeeded(roots_[0]));
}

TEST_F(DataStorageTest, MissingRootIsLoggedAsWarning) {
	fs::create_directories(roots_[0]);
	auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
	sink->set_pattern("%l|%v");
	auto logger = std::make_shared<spdlog::logger>("data_storage_test", sink);
	logger->set_level(spdlog::level::trace);
	spdlog::register_logger(logger);

	DataStorage storage(upgradeManager_);
	storage.recoverTransitionRead(nsInfo_, roots_, StartupOption::kRegular);
	spdlog::drop("data_storage_test");

	EXPECT_THAT(sink->last_formatted(),
	            ::testing::Contains(HasSubstr("warning|Storage directory " +
	                                          roots_[1].string() + " does not exist")));
}

TEST_F(DataStorageTest, NoUsableRoot) {
	DataStorage storage(upgradeManager_);

	try {
		storage.recoverTransitionRead(nsInfo_, roots_, StartupOption::kRegular);
		FAIL() << "startup without storage should fail";
	} catch (const StorageException &e) {
		EXPECT_THAT(e.what(), HasSubstr("All specified directories are not accessible"));
	}
	EXPECT_FALSE(storage.isInitialized());
}

TEST_F(DataStorageTest, RegularStartIsIdempotent) {
	makeFederationRoot(roots_[0], kCurrentLayoutVersion);
	makeFederationRoot(roots_[1], kCurrentLayoutVersion);

	{
		DataStorage storage(upgradeManager_);
		storage.recoverTransitionRead(nsInfo_, roots_, StartupOption::kRegular);
		EXPECT_EQ(storage.storageId(), kOldStorageId);
		for (const auto &result : storage.lastTransitionResults()) {
			EXPECT_EQ(result.kind, TransitionResult::Kind::kUnchanged);
		}
	}
	auto before = snapshotTree(scratch_.path());

	DataStorage storage(upgradeManager_);
	storage.recoverTransitionRead(nsInfo_, roots_, StartupOption::kRegular);
	storage.recoverTransitionRead(nsInfo_, roots_, StartupOption::kRegular);

	EXPECT_EQ(snapshotTree(scratch_.path()), before);
	EXPECT_EQ(storage.storageId(), kOldStorageId);
}

TEST_F(DataStorageTest, ConflictingStorageIds) {
	makeFederationRoot(roots_[0], kCurrentLayoutVersion);
	makeFederationRoot(roots_[1], kCurrentLayoutVersion);
	VersionRecordCodec::write(roots_[1] / kCurrentDirName / kVersionFileName,
	                          FederationRecord{kCurrentLayoutVersion, "DS-1-10.0.0.2-9866-1"});
	DataStorage storage(upgradeManager_);

	EXPECT_THROW(storage.recoverTransitionRead(nsInfo_, roots_, StartupOption::kRegular),
	             InconsistentStateException);
	EXPECT_FALSE(storage.isInitialized());
}

TEST_F(DataStorageTest, FutureLayoutIsRejected) {
	makeFederationRoot(roots_[0], kCurrentLayoutVersion - 1);
	auto before = snapshotTree(roots_[0] / kCurrentDirName);
	DataStorage storage(upgradeManager_);

	try {
		storage.recoverTransitionRead(nsInfo_, {roots_[0]}, StartupOption::kRegular);
		FAIL() << "a future layout should be refused";
	} catch (const IncorrectVersionException &e) {
		EXPECT_THAT(e.what(), HasSubstr("Future version is not allowed"));
	}
	EXPECT_EQ(snapshotTree(roots_[0] / kCurrentDirName), before);
	EXPECT_FALSE(fs::exists(roots_[0] / kPreviousDirName));
	EXPECT_FALSE(fs::exists(roots_[0] / kLegacyStorageFileName));
}

TEST_F(DataStorageTest, LayoutTooOldToUpgrade) {
	makePreFederationRoot(roots_[0], kLastUpgradableLayoutVersion + 2);
	DataStorage storage(upgradeManager_);

	EXPECT_THROW(storage.recoverTransitionRead(nsInfo_, {roots_[0]}, StartupOption::kRegular),
	             IncorrectVersionException);
	EXPECT_FALSE(fs::exists(roots_[0] / kPreviousDirName));
}

TEST_F(DataStorageTest, NamespaceMismatch) {
	makePreFederationRoot(roots_[0], -18, kNamespaceId + 1);
	DataStorage storage(upgradeManager_);

	try {
		storage.recoverTransitionRead(nsInfo_, {roots_[0]}, StartupOption::kRegular);
		FAIL() << "a root of another namespace should be refused";
	} catch (const NamespaceMismatchException &e) {
		EXPECT_THAT(e.what(), HasSubstr("Incompatible namespaceIDs"));
		EXPECT_THAT(e.what(), HasSubstr("namenode namespaceID = 7"));
		EXPECT_THAT(e.what(), HasSubstr("datanode namespaceID = 8"));
	}
	EXPECT_FALSE(fs::exists(roots_[0] / kPreviousDirName));
}

TEST_F(DataStorageTest, PreFederationUpgradeThenFinalize) {
	makePreFederationRoot(roots_[0]);
	makePreFederationRoot(roots_[1]);
	EXPECT_CALL(upgradeManager_, verifyDistributedUpgradeProgress(_)).Times(2);
	DataStorage storage(upgradeManager_);

	storage.recoverTransitionRead(nsInfo_, roots_, StartupOption::kRegular);

	EXPECT_EQ(storage.storageId(), kOldStorageId);
	for (const auto &result : storage.lastTransitionResults()) {
		EXPECT_EQ(result.kind, TransitionResult::Kind::kUpgraded);
	}
	for (const auto &root : roots_) {
		auto sliceCurrent = root / kCurrentDirName / "NS-7" / kCurrentDirName;
		EXPECT_EQ(VersionRecordCodec::readNode(root / kCurrentDirName / kVersionFileName),
		          NodeVersionRecord(FederationRecord{kCurrentLayoutVersion, kOldStorageId}));
		EXPECT_EQ(VersionRecordCodec::readSlice(sliceCurrent / kVersionFileName),
		          (NamespaceSliceRecord{kCurrentLayoutVersion, kNamespaceId, kCreationTime}));
		EXPECT_TRUE(fs::equivalent(root / kPreviousDirName / "blk_1", sliceCurrent / "blk_1"));
		EXPECT_TRUE(fs::exists(sliceCurrent / "subdir0" / "blk_2"));
		EXPECT_FALSE(fs::exists(root / kCurrentDirName / "blk_1"));
		EXPECT_EQ(layoutVersionOf(
		              VersionRecordCodec::readNode(root / kPreviousDirName / kVersionFileName)),
		          -18);
	}

	storage.finalizeUpgrade(kNamespaceId);
	storage.waitForFinalize();
	for (const auto &root : roots_) {
		EXPECT_FALSE(fs::exists(root / kPreviousDirName));
		EXPECT_FALSE(fs::exists(root / kFinalizedTmpDirName));
		EXPECT_EQ(readFile(root / kCurrentDirName / "NS-7" / kCurrentDirName / "blk_1"),
		          "block one");
	}
	storage.unlockAll();

	// Nothing is left to roll back to.
	auto before = snapshotTree(roots_[0] / kCurrentDirName);
	NiceMock<UpgradeManagerMock> upgradeManager;
	DataStorage rollback(upgradeManager);
	rollback.recoverTransitionRead(nsInfo_, roots_, StartupOption::kRollback);
	for (const auto &result : rollback.lastTransitionResults()) {
		EXPECT_EQ(result.kind, TransitionResult::Kind::kUnchanged);
	}
	EXPECT_EQ(snapshotTree(roots_[0] / kCurrentDirName), before);
}

TEST_F(DataStorageTest, RollbackOfPreFederationSnapshotUpgradesAgain) {
	makePreFederationRoot(roots_[0]);
	{
		DataStorage storage(upgradeManager_);
		storage.recoverTransitionRead(nsInfo_, {roots_[0]}, StartupOption::kRegular);
	}
	writeFile(roots_[0] / kCurrentDirName / "NS-7" / kCurrentDirName / "blk_3", "new block");

	DataStorage storage(upgradeManager_);
	storage.recoverTransitionRead(nsInfo_, {roots_[0]}, StartupOption::kRollback);

	ASSERT_EQ(storage.lastTransitionResults().size(), 1U);
	EXPECT_EQ(storage.lastTransitionResults()[0].kind, TransitionResult::Kind::kRolledBack);
	// The restored layout is older than this build handles, so it is upgraded
	// right away from the restored blocks.
	auto sliceCurrent = roots_[0] / kCurrentDirName / "NS-7" / kCurrentDirName;
	EXPECT_TRUE(fs::exists(sliceCurrent / "blk_1"));
	EXPECT_FALSE(fs::exists(sliceCurrent / "blk_3"));
	EXPECT_TRUE(fs::exists(roots_[0] / kPreviousDirName / "blk_1"));
}

TEST_F(DataStorageTest, FailedUpgradeCommitsNoRoot) {
	for (const auto &root : roots_) {
		makeFederationRoot(root, kFederationLayoutVersion);
		addSliceBlocks(root, kFederationLayoutVersion);
	}
	plantUncopyableFile(roots_[1] / kCurrentDirName);
	DataStorage storage(upgradeManager_);

	try {
		storage.recoverTransitionRead(nsInfo_, roots_, StartupOption::kRegular);
		FAIL() << "upgrade of " << roots_[1] << " should fail";
	} catch (const TransitionFailedException &e) {
		EXPECT_THAT(e.what(), HasSubstr(roots_[1].string()));
	}

	EXPECT_FALSE(storage.isInitialized());
	const auto &results = storage.lastTransitionResults();
	ASSERT_EQ(results.size(), 2U);
	EXPECT_EQ(results[0].kind, TransitionResult::Kind::kUnchanged);
	EXPECT_EQ(results[1].kind, TransitionResult::Kind::kFailed);
	EXPECT_THAT(results[1].cause, HasSubstr("dncp_fifo"));

	// The healthy sibling ran to the end, neither root was committed.
	auto sliceCurrent = roots_[0] / kCurrentDirName / "NS-7" / kCurrentDirName;
	EXPECT_TRUE(fs::equivalent(roots_[0] / kPreviousTmpDirName / "NS-7" / kCurrentDirName /
	                               "blk_9",
	                           sliceCurrent / "blk_9"));
	EXPECT_EQ(VersionRecordCodec::readSlice(sliceCurrent / kVersionFileName),
	          (NamespaceSliceRecord{kFederationLayoutVersion, kNamespaceId, kCreationTime}));
	for (const auto &root : roots_) {
		EXPECT_TRUE(fs::exists(root / kPreviousTmpDirName));
		EXPECT_FALSE(fs::exists(root / kPreviousDirName));
		EXPECT_FALSE(fs::exists(root / kCurrentDirName / kVersionFileName));
	}
}

TEST_F(DataStorageTest, RestartAfterFailedUpgradeKeepsEveryBlock) {
	makeFederationRoot(roots_[0], kFederationLayoutVersion);
	addSliceBlocks(roots_[0], kFederationLayoutVersion);
	plantUncopyableFile(roots_[0] / kCurrentDirName);
	{
		DataStorage storage(upgradeManager_);
		EXPECT_THROW(
		    storage.recoverTransitionRead(nsInfo_, {roots_[0]}, StartupOption::kRegular),
		    TransitionFailedException);
	}
	ASSERT_TRUE(fs::exists(roots_[0] / kPreviousTmpDirName / "dncp_fifo"));
	fs::remove(roots_[0] / kPreviousTmpDirName / "dncp_fifo");

	DataStorage storage(upgradeManager_);
	storage.recoverTransitionRead(nsInfo_, {roots_[0]}, StartupOption::kRegular);

	ASSERT_TRUE(storage.isInitialized());
	ASSERT_EQ(storage.lastTransitionResults().size(), 1U);
	EXPECT_EQ(storage.lastTransitionResults()[0].kind, TransitionResult::Kind::kUpgraded);
	EXPECT_FALSE(fs::exists(roots_[0] / kPreviousTmpDirName));
	EXPECT_EQ(VersionRecordCodec::readNode(roots_[0] / kCurrentDirName / kVersionFileName),
	          NodeVersionRecord(FederationRecord{kCurrentLayoutVersion, kOldStorageId}));
	EXPECT_EQ(layoutVersionOf(VersionRecordCodec::readNode(roots_[0] / kPreviousDirName /
	                                                       kVersionFileName)),
	          kFederationLayoutVersion);
	for (const auto &block : {"blk_1", "subdir0/blk_2", "NS-7/current/blk_9"}) {
		EXPECT_TRUE(fs::equivalent(roots_[0] / kPreviousDirName / block,
		                           roots_[0] / kCurrentDirName / block))
		    << block;
	}
	EXPECT_EQ(readFile(roots_[0] / kCurrentDirName / "subdir0" / "blk_2"), "block two");
}

TEST_F(DataStorageTest, InterruptedRollbackIsJoinedByNextPass) {
	makeFederationRoot(roots_[0], kCurrentLayoutVersion);
	auto previous = roots_[0] / kPreviousDirName;
	writeFile(previous / "blk_old", "old block");
	auto previousVersion = previous / kVersionFileName;
	// The rollback worker blocks reading the snapshot record until it is fed.
	ASSERT_EQ(::mkfifo(previousVersion.c_str(), 0600), 0);
	VersionRecordCodec::write(scratch_.path() / "newer",
	                          FederationRecord{kCurrentLayoutVersion - 1, kOldStorageId});
	auto newerRecord = readFile(scratch_.path() / "newer");

	DataStorage storage(upgradeManager_);
	std::thread firstPass([&]() {
		EXPECT_NO_THROW(
		    storage.recoverTransitionRead(nsInfo_, {roots_[0]}, StartupOption::kRollback));
	});

	int fd = -1;
	for (int i = 0; i < 1000 && fd < 0; ++i) {
		fd = ::open(previousVersion.c_str(), O_WRONLY | O_NONBLOCK);
		if (fd < 0) {
			std::this_thread::sleep_for(std::chrono::milliseconds(5));
		}
	}
	storage.requestStop();
	firstPass.join();
	ASSERT_GE(fd, 0) << "the rollback worker never opened " << previousVersion;
	EXPECT_FALSE(storage.isInitialized());

	// The abandoned worker refuses this record, the next pass gets a valid one.
	EXPECT_EQ(::write(fd, newerRecord.data(), newerRecord.size()),
	          static_cast<ssize_t>(newerRecord.size()));
	::close(fd);
	fs::remove(previousVersion);
	VersionRecordCodec::write(previousVersion,
	                          FederationRecord{kFederationLayoutVersion, kOldStorageId});

	storage.recoverTransitionRead(nsInfo_, {roots_[0]}, StartupOption::kRollback);

	ASSERT_TRUE(storage.isInitialized());
	ASSERT_EQ(storage.lastTransitionResults().size(), 1U);
	EXPECT_EQ(storage.lastTransitionResults()[0].kind, TransitionResult::Kind::kRolledBack);
	EXPECT_EQ(readFile(roots_[0] / kCurrentDirName / "blk_old"), "old block");
	EXPECT_FALSE(fs::exists(roots_[0] / kCurrentDirName / "blk_1"));
	EXPECT_FALSE(fs::exists(roots_[0] / kRemovedTmpDirName));
}

TEST_F(DataStorageTest, DuplicateRootIsExcluded) {
	fs::create_directories(roots_[0]);
	DataStorage storage(upgradeManager_);

	storage.recoverTransitionRead(nsInfo_, {roots_[0], fs::path(roots_[0].string() + "/")},
	                              StartupOption::kRegular);

	ASSERT_EQ(storage.directories().size(), 1U);
	ASSERT_EQ(storage.lastTransitionResults().size(), 2U);
	EXPECT_EQ(storage.lastTransitionResults()[1].kind, TransitionResult::Kind::kFailed);
	EXPECT_THAT(storage.lastTransitionResults()[1].cause, HasSubstr("same lock file"));
}

TEST_F(DataStorageTest, NamespaceSlices) {
	fs::create_directories(roots_[0]);
	fs::create_directories(roots_[1]);
	DataStorage storage(upgradeManager_);
	storage.recoverTransitionRead(nsInfo_, roots_, StartupOption::kRegular);

	EXPECT_THROW(storage.finalizeUpgrade(kNamespaceId), StorageException);

	storage.recoverTransitionRead(kNamespaceId, nsInfo_, roots_, StartupOption::kRegular);
	auto slice = storage.namespaceStorage(kNamespaceId);
	ASSERT_NE(slice, nullptr);
	EXPECT_EQ(slice->directories().size(), 2U);
	for (const auto &root : roots_) {
		EXPECT_EQ(VersionRecordCodec::readSlice(root / kCurrentDirName / "NS-7" /
		                                        kCurrentDirName / kVersionFileName),
		          (NamespaceSliceRecord{kCurrentLayoutVersion, kNamespaceId, kCreationTime}));
	}

	storage.recoverTransitionRead(kNamespaceId, nsInfo_, roots_, StartupOption::kRegular);
	EXPECT_EQ(storage.namespaceStorage(kNamespaceId), slice);
	EXPECT_EQ(storage.registry().size(), 1U);

	storage.removeNamespaceStorage(kNamespaceId);
	EXPECT_EQ(storage.namespaceStorage(kNamespaceId), nullptr);
}

TEST_F(DataStorageTest, FinalizeNamespaceSlices) {
	fs::create_directories(roots_[0]);
	DataStorage storage(upgradeManager_);
	storage.recoverTransitionRead(nsInfo_, {roots_[0]}, StartupOption::kRegular);

	auto sliceRoot = roots_[0] / kCurrentDirName / "NS-7";
	fs::create_directories(sliceRoot / kCurrentDirName);
	VersionRecordCodec::write(sliceRoot / kCurrentDirName / kVersionFileName,
	                          NamespaceSliceRecord{kCurrentLayoutVersion, kNamespaceId, 50});
	writeFile(sliceRoot / kCurrentDirName / "blk_4", "block four");

	storage.recoverTransitionRead(kNamespaceId, nsInfo_, {roots_[0]}, StartupOption::kRegular);
	ASSERT_TRUE(fs::exists(sliceRoot / kPreviousDirName));

	storage.finalizeUpgrade(kNamespaceId);
	storage.waitForFinalize();

	EXPECT_FALSE(fs::exists(sliceRoot / kPreviousDirName));
	EXPECT_EQ(readFile(sliceRoot / kCurrentDirName / "blk_4"), "block four");
}

TEST_F(DataStorageTest, CreateStorageIdKeepsExistingId) {
	DataStorage storage(upgradeManager_);

	storage.createStorageId(1234);
	auto first = storage.storageId();
	storage.createStorageId(4321);

	EXPECT_THAT(first, StartsWith("DS-"));
	EXPECT_THAT(first, HasSubstr("-1234-"));
	EXPECT_EQ(storage.storageId(), first);
}
