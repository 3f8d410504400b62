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

#include <fmt/format.h>

#include "datanode/storage-common/storage_layout.h"

namespace storage {

/// Version state shared by a storage root, a namespace slice and the
/// namespace itself.
struct StorageInfo {
	LayoutVersion layoutVersion = kCurrentLayoutVersion;
	int32_t namespaceId = 0;
	int64_t creationTime = 0;

	bool operator==(const StorageInfo &other) const = default;
};

/// Authoritative state of a namespace, handed over by the cluster
/// coordinator when the node registers.
struct NamespaceDescriptor {
	int32_t namespaceId = 0;
	LayoutVersion layoutVersion = kCurrentLayoutVersion;
	int64_t creationTime = 0;
};

/// Intent the node was started with.
enum class StartupOption {
	kRegular,   ///< Start, upgrading directories when needed.
	kRollback,  ///< Restore every snapshot before starting.
	kFormat,    ///< Wipe and format every directory.
};

inline std::string toString(StartupOption option) {
	switch (option) {
	case StartupOption::kRegular:
		return "regular";
	case StartupOption::kRollback:
		return "rollback";
	case StartupOption::kFormat:
		return "format";
	}
	return "unknown";
}

/// "LV = -37 CTime = 100", used by the version mismatch messages.
inline std::string describeState(LayoutVersion layoutVersion, int64_t creationTime) {
	return fmt::format("LV = {} CTime = {}", layoutVersion, creationTime);
}

}  // namespace storage
