/*
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

#ifdef HAVE_PROMETHEUS
#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/registry.h>
#include <prometheus/family.h>

using CounterFamily = prometheus::Family<prometheus::Counter>;

#endif

namespace metrics {

class Counter {
public:
enum Key : unsigned int {
	KEY_START = 0,            // Used internally, has no effect
	DIRS_FORMATTED,           // Storage directories formatted
	DIRS_UPGRADED,            // Storage directories upgraded
	DIRS_ROLLED_BACK,         // Storage directories rolled back
	DIRS_FINALIZED,           // Storage directories finalized
	DIRS_EXCLUDED,            // Storage directories excluded after probing
	HARD_LINKS,               // Hard links created while migrating
	PHYSICAL_COPIES,          // Files copied while migrating
	KEY_END,                  // Used internally, has no effect
};

#ifdef HAVE_PROMETHEUS
	Counter() : counter_(nullptr) {};
	Counter(const prometheus::Labels &labels, CounterFamily *family) :
		counter_(&family->Add(labels)) {};

	static void increment(Key key, double n = 1);

private:
	prometheus::Counter* counter_;
#else
	// Dummy methods for packages without prometheus
	explicit Counter() = default;

	static void increment(Key /*unused*/, double  /*unused*/= 1) {
	}
#endif
};

void init(const char* host);
void destroy();

} // metrics
