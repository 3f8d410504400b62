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
#include "datanode/storage_id.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <array>
#include <chrono>
#include <cstdint>

#include <fmt/format.h>

#include "common/random.h"
#include "slogger/slogger.h"

namespace storage {

std::string localIpAddress() {
	std::array<char, 256> hostname{};
	if (::gethostname(hostname.data(), hostname.size() - 1) != 0) {
		return kUnknownIp;
	}

	addrinfo hints{};
	hints.ai_family = AF_INET;
	hints.ai_socktype = SOCK_STREAM;
	addrinfo *result = nullptr;
	int status = ::getaddrinfo(hostname.data(), nullptr, &hints, &result);
	if (status != 0 || result == nullptr) {
		ksfs::log_warn("can't resolve host name {}: {}", hostname.data(), gai_strerror(status));
		return kUnknownIp;
	}

	std::array<char, INET_ADDRSTRLEN> address{};
	const auto *ipv4 = reinterpret_cast<const sockaddr_in *>(result->ai_addr);
	const char *text = ::inet_ntop(AF_INET, &ipv4->sin_addr, address.data(), address.size());
	::freeaddrinfo(result);
	return text != nullptr ? std::string(text) : kUnknownIp;
}

std::string createStorageId(uint16_t port) {
	auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
	                  std::chrono::system_clock::now().time_since_epoch())
	                  .count();
	return fmt::format("DS-{}-{}-{}-{}", rnd_ranged<uint32_t>(INT32_MAX), localIpAddress(), port,
	                   millis);
}

}  // namespace storage
