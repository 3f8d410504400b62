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

#include <filesystem>
#include <string>

namespace storage {

/// Warning stored in the poisoned `storage` file after the version header.
extern const std::string kLegacyStorageWarning;

/// True if the root still uses the layout that predates the `storage` marker
/// file version check, such a root would need a conversion this build does
/// not support. A missing marker file needs no conversion.
/// Throws StorageException when the file exists but cannot be read.
bool isConversionNeeded(const std::filesystem::path &root);

/// Writes the `storage` marker file, unless it already exists, with a layout
/// version that old binaries reject, so they refuse to start against this
/// layout. Returns KESTRELFS_STATUS_OK or an error status.
int corruptPreUpgradeStorage(const std::filesystem::path &root);

}  // namespace storage
