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
#include "datanode/storage-common/version_record.h"
#include "unittests/temporary_directory.h"

using namespace storage;
using ::testing::HasSubstr;

TEST(VersionRecordCodecTests, FederationRecordHasNoNamespaceFields) {
	auto content = VersionRecordCodec::encode(
	    NodeVersionRecord{FederationRecord{kCurrentLayoutVersion, "DS-1-10.0.0.1-9866-1"}});

	EXPECT_EQ(content,
	          "#KestrelFS storage version record\n"
	          "storageID=DS-1-10.0.0.1-9866-1\n"
	          "storageType=DATA_NODE\n"
	          "layoutVersion=-37\n");
}

TEST(VersionRecordCodecTests, PreFederationRecordKeepsNamespaceFields) {
	auto content = VersionRecordCodec::encode(
	    NodeVersionRecord{PreFederationRecord{-32, "DS-7", 1234, 55}});

	EXPECT_THAT(content, HasSubstr("namespaceID=1234\n"));
	EXPECT_THAT(content, HasSubstr("cTime=55\n"));
	EXPECT_THAT(content, HasSubstr("layoutVersion=-32\n"));
}

TEST(VersionRecordCodecTests, DecodeSelectsAlternativeByLayoutVersion) {
	auto oldRecord = VersionRecordCodec::decodeNode(
	    "layoutVersion=-18\nstorageType=DATA_NODE\nnamespaceID=9\ncTime=3\nstorageID=\n",
	    "VERSION");
	ASSERT_TRUE(std::holds_alternative<PreFederationRecord>(oldRecord));
	EXPECT_EQ(std::get<PreFederationRecord>(oldRecord), (PreFederationRecord{-18, "", 9, 3}));

	// Namespace fields of a federation-era record are ignored.
	auto newRecord = VersionRecordCodec::decodeNode(
	    "layoutVersion=-35\nstorageType=DATA_NODE\nnamespaceID=9\nstorageID=DS-2\n", "VERSION");
	ASSERT_TRUE(std::holds_alternative<FederationRecord>(newRecord));
	EXPECT_EQ(std::get<FederationRecord>(newRecord), (FederationRecord{-35, "DS-2"}));
}

TEST(VersionRecordCodecTests, DecodeSkipsCommentsAndWhitespace) {
	auto record = VersionRecordCodec::decodeSlice(
	    "#Tue Oct 13 10:00:00 UTC 2026\n"
	    "! legacy comment\n"
	    "\n"
	    "  cTime = 100 \n"
	    "namespaceID=42\n"
	    "storageType=NAMESPACE_SLICE\n"
	    "layoutVersion=-37\n",
	    "VERSION");

	EXPECT_EQ(record, (NamespaceSliceRecord{-37, 42, 100}));
}

TEST(VersionRecordCodecTests, MissingStorageIdIsRejected) {
	try {
		VersionRecordCodec::decodeNode("layoutVersion=-37\nstorageType=DATA_NODE\n",
		                               "/data/dn1/current/VERSION");
		FAIL() << "decoding should fail";
	} catch (const InconsistentStateException &e) {
		EXPECT_THAT(e.what(), HasSubstr("/data/dn1/current/VERSION has incompatible storage Id."));
	}
}

TEST(VersionRecordCodecTests, MalformedRecordsAreRejected) {
	EXPECT_THROW(VersionRecordCodec::decodeNode(
	                 "layoutVersion=-37\nstorageType=NAMESPACE_SLICE\nstorageID=x\n", "VERSION"),
	             InconsistentStateException);
	EXPECT_THROW(VersionRecordCodec::decodeNode(
	                 "layoutVersion=-3x\nstorageType=DATA_NODE\nstorageID=x\n", "VERSION"),
	             InconsistentStateException);
	EXPECT_THROW(VersionRecordCodec::decodeSlice(
	                 "layoutVersion=-37\nstorageType=NAMESPACE_SLICE\nnamespaceID=1\n", "VERSION"),
	             InconsistentStateException);
}

TEST(VersionRecordCodecTests, WriteReplacesFileContent) {
	unittests::TemporaryDirectory directory("version_record");
	auto file = directory.path() / "VERSION";
	unittests::writeFile(file, std::string(4096, 'x'));

	VersionRecordCodec::write(file, NamespaceSliceRecord{kCurrentLayoutVersion, 7, 12});

	EXPECT_EQ(VersionRecordCodec::readSlice(file), (NamespaceSliceRecord{-37, 7, 12}));
	EXPECT_THROW(VersionRecordCodec::readSlice(directory.path() / "missing"), StorageException);
}

TEST(VersionRecordTests, StorageInfoOfFederationRecordUsesFallback) {
	StorageInfo fallback{kCurrentLayoutVersion, 5, 0};

	EXPECT_EQ(storageInfoOf(NodeVersionRecord{FederationRecord{-36, "id"}}, fallback),
	          (StorageInfo{-36, 5, 0}));
	EXPECT_EQ(storageInfoOf(NodeVersionRecord{PreFederationRecord{-20, "id", 9, 4}}, fallback),
	          (StorageInfo{-20, 9, 4}));
}

TEST(VersionRecordTests, ReconcileStorageId) {
	std::string known;
	reconcileStorageId(known, NodeVersionRecord{FederationRecord{-37, "DS-1"}}, "/data/a");
	EXPECT_EQ(known, "DS-1");

	// A root without an id yet is fine.
	reconcileStorageId(known, NodeVersionRecord{FederationRecord{-37, ""}}, "/data/b");
	EXPECT_EQ(known, "DS-1");

	EXPECT_THROW(
	    reconcileStorageId(known, NodeVersionRecord{FederationRecord{-37, "DS-2"}}, "/data/c"),
	    InconsistentStateException);
}
