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
#include <string>

namespace storage {

/// On-disk layout versions. Negative, a smaller number is a newer layout.
using LayoutVersion = int32_t;

/// Layout written by this build.
constexpr LayoutVersion kCurrentLayoutVersion = -37;

/// First layout keeping block data in per namespace slices.
constexpr LayoutVersion kFederationLayoutVersion = -35;

/// Last layout whose meta file names carry no generation stamp.
constexpr LayoutVersion kPreGenerationStampLayoutVersion = -13;

/// Oldest layout that can still be upgraded in place.
constexpr LayoutVersion kLastUpgradableLayoutVersion = -7;

/// Last layout predating the legacy `storage` marker file.
constexpr LayoutVersion kLastPreUpgradeLayoutVersion = -3;

/// Generation stamp given to blocks written before generation stamps existed.
constexpr int64_t kGrandfatherGenerationStamp = 0;

/// True if the layout is a pre-federation one (no namespace slices).
inline bool isPreFederationLayout(LayoutVersion layoutVersion) {
	return layoutVersion > kFederationLayoutVersion;
}

// Directory and file names inside a storage root.
inline const std::string kCurrentDirName = "current";
inline const std::string kPreviousDirName = "previous";
inline const std::string kPreviousTmpDirName = "previous.tmp";
inline const std::string kRemovedTmpDirName = "removed.tmp";
inline const std::string kFinalizedTmpDirName = "finalized.tmp";
inline const std::string kLastCheckpointTmpDirName = "lastcheckpoint.tmp";
inline const std::string kPreviousCheckpointDirName = "previous.checkpoint";
inline const std::string kTmpDirName = "tmp";
inline const std::string kBlocksBeingWrittenDirName = "blocksBeingWritten";
inline const std::string kVersionFileName = "VERSION";
inline const std::string kLockFileName = "in_use.lock";
inline const std::string kLegacyStorageFileName = "storage";

// Name prefixes of the block population.
inline const std::string kBlockFilePrefix = "blk_";
inline const std::string kBlockSubdirPrefix = "subdir";
inline const std::string kStagedCopyFilePrefix = "dncp_";
inline const std::string kNamespaceDirPrefix = "NS-";

/// Name of the slice directory of a namespace, e.g. "NS-1234".
inline std::string namespaceDirName(int32_t namespaceId) {
	return kNamespaceDirPrefix + std::to_string(namespaceId);
}

}  // namespace storage
