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
#include "datanode/storage-common/upgrade_manager.h"

#include "config/cfg.h"
#include "slogger/slogger.h"

namespace storage {

DefaultUpgradeManager::DefaultUpgradeManager() {
	reloadConfig();
}

void DefaultUpgradeManager::reloadConfig() {
	port_ = cfg_get("DATANODE_PORT", kDefaultDatanodePort);
}

void DefaultUpgradeManager::verifyDistributedUpgradeProgress(const NamespaceDescriptor &nsInfo) {
	ksfs::log_debug("no distributed upgrade in progress for namespace {}", nsInfo.namespaceId);
}

}  // namespace storage
