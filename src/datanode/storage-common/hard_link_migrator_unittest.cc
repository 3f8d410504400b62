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

#include "datanode/storage-common/hard_link_migrator.h"
#include "datanode/storage-common/storage_exceptions.h"
#include "datanode/storage-common/storage_utils.h"
#include "unittests/temporary_directory.h"

using namespace storage;
using ::testing::HasSubstr;
using unittests::readFile;
using unittests::writeFile;

class HardLinkMigratorTest : public ::testing::Test {
protected:
	HardLinkMigratorTest()
	    : scratch_("hard_link_migrator_test"),
	      source_(scratch_.path() / "source"),
	      destination_(scratch_.path() / "destination") {
		fs::create_directories(source_);
	}

	bool sameInode(const fs::path &relative) {
		return fs::equivalent(source_ / relative, destination_ / relative);
	}

	unittests::TemporaryDirectory scratch_;
	fs::path source_;
	fs::path destination_;
};

TEST_F(HardLinkMigratorTest, CurrentLayoutLinksBlocksInBulk) {
	writeFile(source_ / "blk_1", "block one");
	writeFile(source_ / "blk_1_1001.meta", "meta one");
	writeFile(source_ / "blk_2", "block two");
	writeFile(source_ / "dncp_blk_3", "staged copy");
	writeFile(source_ / kVersionFileName, "layoutVersion=-37\n");
	writeFile(source_ / "ignored.txt", "not a block");
	writeFile(source_ / "subdir0" / "blk_4", "block four");
	writeFile(source_ / "subdir0" / "blk_4_1002.meta", "meta four");
	fs::create_directories(source_ / "subdir1");

	HardLinkMigrator migrator(kCurrentLayoutVersion);
	migrator.linkBlocks(source_, destination_, true);

	const auto &stats = migrator.statistics();
	EXPECT_EQ(stats.directories, 3U);
	EXPECT_EQ(stats.emptyDirectories, 1U);
	EXPECT_EQ(stats.singleLinks, 0U);
	EXPECT_EQ(stats.multiLinkOperations, 2U);
	EXPECT_EQ(stats.filesInMultiLinks, 5U);
	EXPECT_EQ(stats.physicalCopies, 1U);
	EXPECT_EQ(stats.totalEntries(), 9U);

	EXPECT_TRUE(sameInode("blk_1"));
	EXPECT_TRUE(sameInode("blk_1_1001.meta"));
	EXPECT_TRUE(sameInode("subdir0/blk_4"));
	EXPECT_FALSE(sameInode("dncp_blk_3"));
	EXPECT_EQ(readFile(destination_ / "dncp_blk_3"), "staged copy");
	EXPECT_FALSE(fs::exists(destination_ / kVersionFileName));
	EXPECT_TRUE(fs::is_directory(destination_ / "subdir1"));
	EXPECT_FALSE(fs::exists(destination_ / "ignored.txt"));
}

TEST_F(HardLinkMigratorTest, OldLayoutRenamesMetaFiles) {
	writeFile(source_ / "blk_7", "block seven");
	writeFile(source_ / "blk_7.meta", "meta seven");
	writeFile(source_ / "subdir0" / "blk_-8", "block eight");
	writeFile(source_ / "subdir0" / "blk_-8.meta", "meta eight");

	HardLinkMigrator migrator(kPreGenerationStampLayoutVersion + 3);
	migrator.linkBlocks(source_, destination_, true);

	const auto &stats = migrator.statistics();
	EXPECT_EQ(stats.directories, 2U);
	EXPECT_EQ(stats.singleLinks, 4U);
	EXPECT_EQ(stats.multiLinkOperations, 0U);
	EXPECT_EQ(stats.filesInMultiLinks, 0U);

	EXPECT_TRUE(sameInode("blk_7"));
	EXPECT_FALSE(fs::exists(destination_ / "blk_7.meta"));
	EXPECT_TRUE(fs::equivalent(source_ / "blk_7.meta", destination_ / "blk_7_0.meta"));
	EXPECT_TRUE(fs::equivalent(source_ / "subdir0" / "blk_-8.meta",
	                           destination_ / "subdir0" / "blk_-8_0.meta"));
}

TEST_F(HardLinkMigratorTest, GenerationStampLayoutKeepsNames) {
	writeFile(source_ / "blk_7_12.meta", "meta seven");

	HardLinkMigrator migrator(kPreGenerationStampLayoutVersion - 1);
	migrator.linkBlocks(source_, destination_, true);

	EXPECT_TRUE(sameInode("blk_7_12.meta"));
}

TEST_F(HardLinkMigratorTest, EmptySourceDirectory) {
	HardLinkMigrator migrator(kCurrentLayoutVersion);
	migrator.linkBlocks(source_, destination_, true);

	EXPECT_TRUE(fs::is_directory(destination_));
	EXPECT_EQ(migrator.statistics().directories, 1U);
	EXPECT_EQ(migrator.statistics().emptyDirectories, 1U);
}

TEST_F(HardLinkMigratorTest, MissingDestinationWithoutCreate) {
	writeFile(source_ / "blk_1", "block one");

	HardLinkMigrator migrator(kCurrentLayoutVersion);
	EXPECT_THROW(migrator.linkBlocks(source_, destination_, false), StorageException);
}

TEST_F(HardLinkMigratorTest, ExistingTargetFails) {
	writeFile(source_ / "blk_1", "block one");
	writeFile(destination_ / "blk_1", "stale");

	HardLinkMigrator migrator(kCurrentLayoutVersion);
	try {
		migrator.linkBlocks(source_, destination_, false);
		FAIL() << "linking over an existing file should fail";
	} catch (const StorageException &e) {
		EXPECT_THAT(e.what(), HasSubstr("blk_1"));
	}
	EXPECT_EQ(readFile(destination_ / "blk_1"), "stale");
}

TEST(HardLinkMigratorNames, ConvertMetaFileName) {
	EXPECT_EQ(HardLinkMigrator::convertMetaFileName("blk_12.meta"), "blk_12_0.meta");
	EXPECT_EQ(HardLinkMigrator::convertMetaFileName("blk_-12.meta"), "blk_-12_0.meta");
	EXPECT_EQ(HardLinkMigrator::convertMetaFileName("blk_12_5.meta"), "blk_12_5.meta");
	EXPECT_EQ(HardLinkMigrator::convertMetaFileName("blk_12"), "blk_12");
	EXPECT_EQ(HardLinkMigrator::convertMetaFileName("subdir0"), "subdir0");
}

TEST(HardLinkMigratorNames, CopiedPhysically) {
	EXPECT_TRUE(HardLinkMigrator::isCopiedPhysically("dncp_blk_1"));
	EXPECT_FALSE(HardLinkMigrator::isCopiedPhysically(kVersionFileName));
	EXPECT_FALSE(HardLinkMigrator::isCopiedPhysically("blk_1"));
	EXPECT_FALSE(HardLinkMigrator::isCopiedPhysically("VERSION.bak"));
}

TEST(LinkStatisticsTests, SumAndReport) {
	LinkStatistics first;
	first.directories = 2;
	first.singleLinks = 3;
	LinkStatistics second;
	second.directories = 1;
	second.emptyDirectories = 1;
	second.multiLinkOperations = 1;
	second.filesInMultiLinks = 4;
	second.physicalCopies = 1;

	first += second;

	EXPECT_EQ(first.directories, 3U);
	EXPECT_EQ(first.totalEntries(), 11U);
	EXPECT_THAT(first.report(), HasSubstr("HardLinkStats: 3 Directories, including 1 Empty"));
	EXPECT_THAT(first.report(), HasSubstr("total 7 linkable files"));
	EXPECT_THAT(first.report(), HasSubstr("physically copied 1 other files"));
}
