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

#include "common/platform.h"

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

#ifdef HAVE_PROMETHEUS
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Warray-bounds"
#pragma GCC diagnostic ignored "-Wstringop-overflow"
#include <prometheus/counter.h>
#pragma GCC diagnostic pop
#include <prometheus/detail/builder.h>
#include <prometheus/family.h>
#include <prometheus/registry.h>
#include <array>
#include <exception>
#endif

#include "metrics.h"
#include "slogger/slogger.h"

constexpr auto THREAD_SLEEP_TIME_MS = 100;

namespace metrics {

std::unique_ptr<std::jthread>
    metrics_main_thread;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void destroy() {
	if (metrics_main_thread != nullptr) {
		metrics_main_thread->request_stop();
		metrics_main_thread.reset();
	}
}

#ifndef HAVE_PROMETHEUS
void init(const char* /* unused */) {
	ksfs::log_err(
	    "could not setup prometheus server: Prometheus isn't compiled with "
	    "this program");
}
}
#else

prometheus::Family<prometheus::Counter> &setup_family(
    const char *name, const char *help,
    std::shared_ptr<prometheus::Registry> &registry) {
	return prometheus::BuildCounter().Name(name).Help(help).Register(*registry);
}

class Counters {
public:
	Counters() {
		registry = std::make_shared<prometheus::Registry>();
		// NOLINTBEGIN(cppcoreguidelines-prefer-member-initializer)
		directory_counter = &setup_family(
		    "storage_directory_transitions_total",
		    "Number of storage directory state transitions", registry);
		migration_counter = &setup_family(
		    "storage_migration_files_total",
		    "Number of files migrated during upgrades", registry);
		// NOLINTEND(cppcoreguidelines-prefer-member-initializer)

		// Cases follow the enum order, each one falls through to the next.
		Counter::Key start = Counter::KEY_START;
		switch (start) {
		case Counter::KEY_START:
		case Counter::DIRS_FORMATTED:
			counters[Counter::DIRS_FORMATTED] =
			    Counter({{"transition", "format"}}, directory_counter);
			[[fallthrough]];
		case Counter::DIRS_UPGRADED:
			counters[Counter::DIRS_UPGRADED] =
			    Counter({{"transition", "upgrade"}}, directory_counter);
			[[fallthrough]];
		case Counter::DIRS_ROLLED_BACK:
			counters[Counter::DIRS_ROLLED_BACK] =
			    Counter({{"transition", "rollback"}}, directory_counter);
			[[fallthrough]];
		case Counter::DIRS_FINALIZED:
			counters[Counter::DIRS_FINALIZED] =
			    Counter({{"transition", "finalize"}}, directory_counter);
			[[fallthrough]];
		case Counter::DIRS_EXCLUDED:
			counters[Counter::DIRS_EXCLUDED] =
			    Counter({{"transition", "exclude"}}, directory_counter);
			[[fallthrough]];
		case Counter::HARD_LINKS:
			counters[Counter::HARD_LINKS] =
			    Counter({{"method", "hardlink"}}, migration_counter);
			[[fallthrough]];
		case Counter::PHYSICAL_COPIES:
			counters[Counter::PHYSICAL_COPIES] =
			    Counter({{"method", "copy"}}, migration_counter);
			[[fallthrough]];
		case Counter::KEY_END:
			break;
		}
	}

	std::shared_ptr<prometheus::Registry> get_registry() {
		return registry;
	}

	inline Counter& get(Counter::Key type) {
		return counters[type]; // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
	}

private:
	std::shared_ptr<prometheus::Registry> registry;

	prometheus::Family<prometheus::Counter> *directory_counter;
	prometheus::Family<prometheus::Counter> *migration_counter;

	std::array<Counter, Counter::Key::KEY_END + 1> counters;
};
Counters counters;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void Counter::increment(Key key, double n) {
	auto &counter = counters.get(key);
	if (counter.counter_ != nullptr) { counter.counter_->Increment(n); }
}

void prometheus_loop(const std::stop_token& stop, std::string host) {
	try {
		prometheus::Exposer exposer{host};

		exposer.RegisterCollectable(counters.get_registry());
		ksfs::log_info("started prometheus server on {}", host);

		while (!stop.stop_requested()) {
			std::this_thread::sleep_for(std::chrono::milliseconds(THREAD_SLEEP_TIME_MS));
		}
	} catch (std::exception &e) {
		ksfs::log_err("could not setup prometheus server: {}", e.what());
	}
}

void init(const char* host) {
	metrics_main_thread = std::make_unique<std::jthread>(prometheus_loop, std::string(host));
}

}
#endif
