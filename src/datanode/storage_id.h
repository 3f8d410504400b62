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

/// Placeholder used in storage ids when the host address is unknown.
inline const std::string kUnknownIp = "unknownIP";

/// First IPv4 address the host name resolves to, kUnknownIp on failure.
std::string localIpAddress();

/// New storage id: "DS-<random>-<ip>-<port>-<milliseconds since epoch>".
std::string createStorageId(uint16_t port);

}  // namespace storage
