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
#include <vector>

#include "datanode/storage-common/storage_layout.h"

namespace storage {

/// Counters of one migration.
struct LinkStatistics {
	uint64_t directories = 0;          ///< Directories visited.
	uint64_t emptyDirectories = 0;     ///< Directories without linkable entries.
	uint64_t singleLinks = 0;          ///< Files linked one by one.
	uint64_t multiLinkOperations = 0;  ///< Bulk link operations.
	uint64_t filesInMultiLinks = 0;    ///< Files linked by bulk operations.
	uint64_t physicalCopies = 0;       ///< Files copied byte by byte.

	/// Directories plus every file linked or copied.
	uint64_t totalEntries() const {
		return directories + singleLinks + filesInMultiLinks + physicalCopies;
	}

	LinkStatistics &operator+=(const LinkStatistics &other);

	/// One line summary for the logs.
	std::string report() const;
};

/**
 * @brief Rebuilds a block tree at a new place using hard links.
 *
 * Block files are hard linked, staged copies (dncp_*) are copied since they
 * must not share an inode between the snapshot and the new tree. VERSION
 * files are never mirrored. Sources written before generation stamps existed get their meta
 * files renamed to the current naming while linking, file by file. Newer
 * sources link all block files of a directory in one bulk operation.
 *
 * Failures throw StorageException naming the offending path.
 */
class HardLinkMigrator {
public:
	explicit HardLinkMigrator(LayoutVersion sourceLayoutVersion);

	/// Mirrors `from` (file or directory) at `to`. When createDestination is
	/// false the top destination directory must already exist.
	void linkBlocks(const std::filesystem::path &from, const std::filesystem::path &to,
	                bool createDestination);

	const LinkStatistics &statistics() const { return stats_; }

	/// "blk_12.meta" becomes "blk_12_0.meta", other names are unchanged.
	static std::string convertMetaFileName(const std::string &name);

	/// True for files copied instead of linked.
	static bool isCopiedPhysically(const std::string &name);

private:
	void linkFile(const std::filesystem::path &from, const std::filesystem::path &to);
	void linkDirectory(const std::filesystem::path &from, const std::filesystem::path &to,
	                   bool createDestination);

	/// Hard links every name from fromDir into toDir, opening both
	/// directories once.
	void linkAll(const std::filesystem::path &fromDir, const std::filesystem::path &toDir,
	             const std::vector<std::string> &names);

	bool needsMetaRename() const;

	LayoutVersion sourceLayoutVersion_;
	LinkStatistics stats_;
};

}  // namespace storage
