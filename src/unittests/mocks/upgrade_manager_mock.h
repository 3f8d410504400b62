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

#include <gmock/gmock.h>

#include "datanode/storage-common/upgrade_manager.h"

class UpgradeManagerMock : public storage::IUpgradeManager {
public:
	MOCK_METHOD(uint16_t, port, (), (const, override));
	MOCK_METHOD(void, verifyDistributedUpgradeProgress, (const storage::NamespaceDescriptor &),
	            (override));
};
