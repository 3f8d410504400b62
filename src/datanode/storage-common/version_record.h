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
#include <string>
#include <variant>

#include "datanode/storage-common/storage_info.h"
#include "datanode/storage-common/storage_layout.h"

namespace storage {

enum class StorageType {
	kDataNode,        ///< Storage root of a datanode.
	kNamespaceSlice,  ///< Namespace slice nested in a storage root.
};

/// Name written to the storageType field.
std::string toString(StorageType type);

/// Storage root record of a pre-federation layout. The root belongs to a
/// single namespace, so the namespace fields live in the root record.
struct PreFederationRecord {
	LayoutVersion layoutVersion = kCurrentLayoutVersion;
	std::string storageId;
	int32_t namespaceId = 0;
	int64_t creationTime = 0;

	bool operator==(const PreFederationRecord &) const = default;
};

/// Storage root record of a federation-era layout. Namespace fields moved
/// to the slice records.
struct FederationRecord {
	LayoutVersion layoutVersion = kCurrentLayoutVersion;
	std::string storageId;

	bool operator==(const FederationRecord &) const = default;
};

/// Persistent version record of a storage root, the alternative is selected
/// by the stored layout version.
using NodeVersionRecord = std::variant<PreFederationRecord, FederationRecord>;

/// Persistent version record of a namespace slice.
struct NamespaceSliceRecord {
	LayoutVersion layoutVersion = kCurrentLayoutVersion;
	int32_t namespaceId = 0;
	int64_t creationTime = 0;

	bool operator==(const NamespaceSliceRecord &) const = default;
};

/// Builds the record alternative matching info.layoutVersion.
NodeVersionRecord makeNodeVersionRecord(const StorageInfo &info, const std::string &storageId);

LayoutVersion layoutVersionOf(const NodeVersionRecord &record);
const std::string &storageIdOf(const NodeVersionRecord &record);

/// Version state stored in the record. Federation-era records carry no
/// namespace fields, those are taken from `fallback`.
StorageInfo storageInfoOf(const NodeVersionRecord &record, const StorageInfo &fallback);

/**
 * @brief Text codec of the VERSION files.
 *
 * The format is a '#' header line followed by key=value lines in a fixed
 * order. Decoding accepts any order, skips blank lines and '#' or '!'
 * comments and throws InconsistentStateException (naming `source`) when a
 * field is missing, malformed or the storage type does not match.
 */
class VersionRecordCodec {
public:
	static std::string encode(const NodeVersionRecord &record);
	static std::string encode(const NamespaceSliceRecord &record);

	static NodeVersionRecord decodeNode(const std::string &content, const std::string &source);
	static NamespaceSliceRecord decodeSlice(const std::string &content, const std::string &source);

	/// Reads and decodes a version file. Throws StorageException on I/O errors.
	static NodeVersionRecord readNode(const std::filesystem::path &file);
	static NamespaceSliceRecord readSlice(const std::filesystem::path &file);

	/// Encodes and writes a version file with fsync.
	static void write(const std::filesystem::path &file, const NodeVersionRecord &record);
	static void write(const std::filesystem::path &file, const NamespaceSliceRecord &record);
};

/// Checks the storage id of a record read from `root` against the id the
/// node already knows and adopts it when the node has none yet.
/// Throws InconsistentStateException on a conflict.
void reconcileStorageId(std::string &knownStorageId, const NodeVersionRecord &record,
                        const std::string &root);

}  // namespace storage
