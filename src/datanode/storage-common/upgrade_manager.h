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

#include "datanode/storage-common/storage_info.h"

namespace storage {

/// Port used when DATANODE_PORT is not configured.
static constexpr uint16_t kDefaultDatanodePort = 9866;

/// Cluster side collaborator consulted before a storage transition.
class IUpgradeManager {
public:
	virtual ~IUpgradeManager() = default;

	/// Port the node serves on, part of newly created storage ids.
	virtual uint16_t port() const = 0;

	/// Throws to veto a transition conflicting with a cluster wide upgrade.
	virtual void verifyDistributedUpgradeProgress(const NamespaceDescriptor &nsInfo) = 0;
};

/// Upgrade manager of a standalone node: knows of no distributed upgrade.
class DefaultUpgradeManager : public IUpgradeManager {
public:
	DefaultUpgradeManager();

	uint16_t port() const override { return port_; }

	void verifyDistributedUpgradeProgress(const NamespaceDescriptor &nsInfo) override;

	/// Re-reads DATANODE_PORT from the loaded configuration.
	void reloadConfig();

private:
	uint16_t port_ = kDefaultDatanodePort;
};

}  // namespace storage
