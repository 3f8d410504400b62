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

#include "common/exceptions.h"
#include "datanode/storage-common/legacy_storage_file.h"
#include "datanode/storage-common/storage_directory.h"
#include "datanode/storage-common/storage_exceptions.h"
#include "errors/kestrelfs_error_codes.h"
#include "unittests/temporary_directory.h"

using namespace storage;
using unittests::readFile;
using unittests::writeFile;

class StorageDirectoryTest : public ::testing::Test {
protected:
	StorageDirectoryTest() : scratch_("storage_directory_test"), root_(scratch_.path() / "dn1") {
		fs::create_directories(root_);
	}

	void makeCurrent(const fs::path &root) {
		writeFile(root / kCurrentDirName / kVersionFileName, "layoutVersion=-37\n");
	}

	unittests::TemporaryDirectory scratch_;
	fs::path root_;
};

TEST_F(StorageDirectoryTest, MissingRootIsNonExistent) {
	StorageDirectory directory(scratch_.path() / "missing");

	EXPECT_EQ(directory.analyze(StartupOption::kRegular), StorageState::kNonExistent);
	EXPECT_FALSE(directory.isLocked());
	EXPECT_FALSE(fs::exists(scratch_.path() / "missing"));
}

TEST_F(StorageDirectoryTest, FormatCreatesMissingRoot) {
	StorageDirectory directory(scratch_.path() / "new" / "dn");

	EXPECT_EQ(directory.analyze(StartupOption::kFormat), StorageState::kNotFormatted);
	EXPECT_TRUE(directory.isLocked());
	EXPECT_TRUE(fs::exists(scratch_.path() / "new" / "dn" / kLockFileName));
}

TEST_F(StorageDirectoryTest, EmptyRootIsNotFormatted) {
	StorageDirectory directory(root_);

	EXPECT_EQ(directory.analyze(StartupOption::kRegular), StorageState::kNotFormatted);
	EXPECT_TRUE(directory.isLocked());

	directory.unlock();
	EXPECT_FALSE(directory.isLocked());
}

TEST_F(StorageDirectoryTest, TrailingSlashIsIgnored) {
	StorageDirectory directory(root_.string() + "/");

	EXPECT_EQ(directory.root(), root_);
	EXPECT_EQ(directory.versionFile(), root_ / "current" / "VERSION");
	EXPECT_EQ(directory.previousTmpDir(), root_ / "previous.tmp");
}

TEST_F(StorageDirectoryTest, CurrentVersionIsNormal) {
	makeCurrent(root_);
	StorageDirectory directory(root_);

	EXPECT_EQ(directory.analyze(StartupOption::kRegular), StorageState::kNormal);
}

TEST_F(StorageDirectoryTest, PreviousWithoutCurrentIsInconsistent) {
	fs::create_directories(root_ / kPreviousDirName);
	StorageDirectory directory(root_);

	EXPECT_THROW(directory.analyze(StartupOption::kRegular), InconsistentStateException);
}

TEST_F(StorageDirectoryTest, CompleteUpgrade) {
	makeCurrent(root_);
	writeFile(root_ / kPreviousTmpDirName / "blk_1", "old");
	StorageDirectory directory(root_);

	auto state = directory.analyze(StartupOption::kRegular);
	ASSERT_EQ(state, StorageState::kCompleteUpgrade);
	directory.recover(state);

	EXPECT_FALSE(fs::exists(root_ / kPreviousTmpDirName));
	EXPECT_EQ(readFile(root_ / kPreviousDirName / "blk_1"), "old");
	EXPECT_EQ(directory.analyze(StartupOption::kRegular), StorageState::kNormal);
}

TEST_F(StorageDirectoryTest, RecoverUpgrade) {
	writeFile(root_ / kPreviousTmpDirName / kVersionFileName, "old version");
	writeFile(root_ / kCurrentDirName / "blk_half_linked", "");
	StorageDirectory directory(root_);

	auto state = directory.analyze(StartupOption::kRegular);
	ASSERT_EQ(state, StorageState::kRecoverUpgrade);
	directory.recover(state);

	EXPECT_FALSE(fs::exists(root_ / kPreviousTmpDirName));
	EXPECT_FALSE(fs::exists(root_ / kCurrentDirName / "blk_half_linked"));
	EXPECT_EQ(readFile(directory.versionFile()), "old version");
}

TEST_F(StorageDirectoryTest, CompleteAndRecoverRollback) {
	makeCurrent(root_);
	fs::create_directories(root_ / kRemovedTmpDirName / "subdir0");
	StorageDirectory complete(root_);

	auto state = complete.analyze(StartupOption::kRegular);
	ASSERT_EQ(state, StorageState::kCompleteRollback);
	complete.recover(state);
	EXPECT_FALSE(fs::exists(root_ / kRemovedTmpDirName));
	complete.unlock();

	auto other = scratch_.path() / "dn2";
	writeFile(other / kRemovedTmpDirName / kVersionFileName, "rolled back");
	fs::create_directories(other / kPreviousDirName);
	StorageDirectory recover(other);

	state = recover.analyze(StartupOption::kRegular);
	ASSERT_EQ(state, StorageState::kRecoverRollback);
	recover.recover(state);
	EXPECT_EQ(readFile(recover.versionFile()), "rolled back");
	EXPECT_TRUE(fs::exists(other / kPreviousDirName));
}

TEST_F(StorageDirectoryTest, RemovedTmpNeedsExactlyOneOfCurrentAndPrevious) {
	makeCurrent(root_);
	fs::create_directories(root_ / kPreviousDirName);
	fs::create_directories(root_ / kRemovedTmpDirName);
	StorageDirectory directory(root_);

	EXPECT_THROW(directory.analyze(StartupOption::kRegular), InconsistentStateException);
}

TEST_F(StorageDirectoryTest, CompleteFinalize) {
	makeCurrent(root_);
	writeFile(root_ / kFinalizedTmpDirName / "blk_3", "data");
	StorageDirectory directory(root_);

	auto state = directory.analyze(StartupOption::kRegular);
	ASSERT_EQ(state, StorageState::kCompleteFinalize);
	directory.recover(state);
	EXPECT_FALSE(fs::exists(root_ / kFinalizedTmpDirName));

	fs::create_directories(root_ / kFinalizedTmpDirName);
	fs::create_directories(root_ / kPreviousDirName);
	EXPECT_THROW(directory.analyze(StartupOption::kRegular), InconsistentStateException);
}

TEST_F(StorageDirectoryTest, CompleteCheckpoint) {
	makeCurrent(root_);
	writeFile(root_ / kLastCheckpointTmpDirName / "image", "new");
	writeFile(root_ / kPreviousCheckpointDirName / "image", "old");
	StorageDirectory directory(root_);

	auto state = directory.analyze(StartupOption::kRegular);
	ASSERT_EQ(state, StorageState::kCompleteCheckpoint);
	directory.recover(state);

	EXPECT_FALSE(fs::exists(root_ / kLastCheckpointTmpDirName));
	EXPECT_EQ(readFile(root_ / kPreviousCheckpointDirName / "image"), "new");
}

TEST_F(StorageDirectoryTest, TooManyTemporaryDirectories) {
	makeCurrent(root_);
	fs::create_directories(root_ / kPreviousTmpDirName);
	fs::create_directories(root_ / kRemovedTmpDirName);
	StorageDirectory directory(root_);

	EXPECT_THROW(directory.analyze(StartupOption::kRegular), InconsistentStateException);
}

TEST_F(StorageDirectoryTest, RecoverRejectsStatesWithoutRecovery) {
	StorageDirectory directory(root_);

	EXPECT_THROW(directory.recover(StorageState::kNormal), StorageException);
}

TEST_F(StorageDirectoryTest, SameDirectoryConfiguredTwice) {
	StorageDirectory first(root_);
	ASSERT_EQ(first.analyze(StartupOption::kRegular), StorageState::kNotFormatted);

	StorageDirectory second(root_.string() + "/");
	EXPECT_THROW(second.analyze(StartupOption::kRegular, {&first}), InitializeException);
	EXPECT_FALSE(second.isLocked());
	EXPECT_TRUE(first.isLocked());
}

TEST_F(StorageDirectoryTest, ClearDirectory) {
	writeFile(root_ / kCurrentDirName / "subdir1" / "blk_1", "data");
	StorageDirectory directory(root_);

	directory.clearDirectory();

	EXPECT_TRUE(fs::is_directory(root_ / kCurrentDirName));
	EXPECT_TRUE(fs::is_empty(root_ / kCurrentDirName));
}

namespace {

std::string bigEndian(int32_t value) {
	auto bits = static_cast<uint32_t>(value);
	return {static_cast<char>(bits >> 24), static_cast<char>(bits >> 16),
	        static_cast<char>(bits >> 8), static_cast<char>(bits)};
}

}  // namespace

TEST_F(StorageDirectoryTest, LegacyMarker) {
	EXPECT_FALSE(isConversionNeeded(root_));

	writeFile(root_ / kLegacyStorageFileName, bigEndian(kLastPreUpgradeLayoutVersion));
	EXPECT_TRUE(isConversionNeeded(root_));

	writeFile(root_ / kLegacyStorageFileName, "\x01");
	EXPECT_TRUE(isConversionNeeded(root_));

	fs::remove(root_ / kLegacyStorageFileName);
	ASSERT_EQ(corruptPreUpgradeStorage(root_), KESTRELFS_STATUS_OK);
	auto content = readFile(root_ / kLegacyStorageFileName);
	EXPECT_EQ(content.substr(0, 4), bigEndian(kCurrentLayoutVersion));
	EXPECT_EQ(content.substr(6), kLegacyStorageWarning);
	EXPECT_FALSE(isConversionNeeded(root_));

	// An existing marker is left alone.
	writeFile(root_ / kLegacyStorageFileName, bigEndian(-20));
	ASSERT_EQ(corruptPreUpgradeStorage(root_), KESTRELFS_STATUS_OK);
	EXPECT_EQ(readFile(root_ / kLegacyStorageFileName), bigEndian(-20));
}

TEST_F(StorageDirectoryTest, OldLayoutNeedsConversion) {
	makeCurrent(root_);
	writeFile(root_ / kLegacyStorageFileName, bigEndian(-1));
	StorageDirectory directory(root_);

	EXPECT_THROW(directory.analyze(StartupOption::kRegular), InconsistentStateException);
}

TEST(DirectoryConfigurationTests, ParsesLines) {
	DirectoryConfiguration valid("  /data/dn1  ");
	EXPECT_TRUE(valid.isValid);
	EXPECT_EQ(valid.path, "/data/dn1/");

	DirectoryConfiguration comment("# /data/old");
	EXPECT_TRUE(comment.isComment);
	EXPECT_FALSE(comment.isValid);

	DirectoryConfiguration empty("   ");
	EXPECT_TRUE(empty.isEmpty);

	DirectoryConfiguration relative("data/dn1");
	EXPECT_FALSE(relative.isValid);
}

TEST(DirectoryConfigurationTests, ReadDataDirsConfig) {
	unittests::TemporaryDirectory scratch("data_dirs_config");
	auto file = scratch.path() / "data-dirs.cfg";
	writeFile(file, "# storage roots\n/data/dn1\n\n/data/dn2/\n/data/dn1/\nrelative\n");

	EXPECT_THAT(readDataDirsConfig(file.string()),
	            ::testing::ElementsAre("/data/dn1/", "/data/dn2/"));
	EXPECT_THROW(readDataDirsConfig((scratch.path() / "missing.cfg").string()),
	             InitializeException);
}
