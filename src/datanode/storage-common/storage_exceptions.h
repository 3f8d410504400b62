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

#include "common/exception.h"

/// Base of every failure raised while handling storage directories.
KESTRELFS_CREATE_EXCEPTION_CLASS(StorageException, Exception);

/// On-disk state contradicts itself or the namespace (leftover directories,
/// broken version records, snapshot coexistence, rollback to a newer state).
KESTRELFS_CREATE_EXCEPTION_CLASS(InconsistentStateException, StorageException);

/// Layout version the running binary cannot handle.
KESTRELFS_CREATE_EXCEPTION_CLASS(IncorrectVersionException, StorageException);

/// Storage belongs to another namespace.
KESTRELFS_CREATE_EXCEPTION_CLASS(NamespaceMismatchException, StorageException);

/// One or more concurrent transition workers failed.
KESTRELFS_CREATE_EXCEPTION_CLASS(TransitionFailedException, StorageException);
