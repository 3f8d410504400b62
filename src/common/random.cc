/*
   Copyright 2005-2010 Jakub Kruszona-Zawadzki, Gemius SA
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

#include "common/platform.h"
#include "common/random.h"

#include <sys/time.h>
#include <unistd.h>

RandomEngine kRandomEngine;
std::mutex kRandomEngineMutex;

int rnd_init(void) {
	struct timeval tv;
	gettimeofday(&tv, nullptr);
	std::random_device device;
	std::seed_seq seed{static_cast<unsigned>(tv.tv_sec), static_cast<unsigned>(tv.tv_usec),
	                   static_cast<unsigned>(getpid()), device()};
	std::scoped_lock<std::mutex> const lock(kRandomEngineMutex);
	kRandomEngine.seed(seed);
	return 0;
}
