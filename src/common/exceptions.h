/*
   Copyright 2013-2014 EditShare
   Copyright 2013-2015 Skytechnology sp. z o.o.
   Copyright 2023-2026 Leil Storage OÜ

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

KESTRELFS_CREATE_EXCEPTION_CLASS(InitializeException, Exception);
KESTRELFS_CREATE_EXCEPTION_CLASS(ConfigurationException, Exception);
