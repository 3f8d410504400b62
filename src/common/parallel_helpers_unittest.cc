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

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

#include "common/parallel_helpers.h"

TEST(WorkerGroupTest, JoinsEveryTaskInSpawnOrder) {
	std::atomic<int> counter{0};
	parallel::WorkerGroup group;
	for (int i = 0; i < 8; ++i) {
		group.spawn("task" + std::to_string(i), [&counter]() { ++counter; });
	}
	auto results = group.joinAll();

	ASSERT_EQ(8U, results.size());
	EXPECT_EQ(8, counter.load());
	for (int i = 0; i < 8; ++i) {
		EXPECT_EQ("task" + std::to_string(i), results[i].name);
		EXPECT_TRUE(results[i].finished);
		EXPECT_FALSE(results[i].failed());
	}
}

TEST(WorkerGroupTest, FailureDoesNotCancelSiblings) {
	std::atomic<int> completed{0};
	parallel::WorkerGroup group;
	group.spawn("failing", []() { throw std::runtime_error("broken disk"); });
	group.spawn("slow", [&completed]() {
		std::this_thread::sleep_for(std::chrono::milliseconds(50));
		++completed;
	});
	auto results = group.joinAll();

	EXPECT_EQ(1, completed.load());
	ASSERT_TRUE(results[0].failed());
	EXPECT_FALSE(results[1].failed());
	EXPECT_THROW(std::rethrow_exception(results[0].error), std::runtime_error);
}

TEST(WorkerGroupTest, InterruptedJoinReturnsSnapshot) {
	std::promise<void> release;
	auto released = release.get_future().share();
	std::stop_source stopSource;

	parallel::WorkerGroup group;
	group.spawn("quick", []() { throw std::runtime_error("bad snapshot"); });
	group.spawn("blocked", [released]() { released.wait(); });

	// Wait until the quick task is done before interrupting.
	std::vector<parallel::TaskResult> results;
	for (int i = 0; i < 200; ++i) {
		std::stop_source stopped;
		stopped.request_stop();
		group.joinAll(stopped.get_token(), results);
		if (results[0].finished) {
			break;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}

	stopSource.request_stop();
	EXPECT_FALSE(group.joinAll(stopSource.get_token(), results));
	ASSERT_EQ(2U, results.size());
	EXPECT_TRUE(results[0].finished);
	EXPECT_TRUE(results[0].failed());
	EXPECT_FALSE(results[1].finished);

	release.set_value();
	std::stop_source never;
	EXPECT_TRUE(group.joinAll(never.get_token(), results));
	EXPECT_TRUE(results[1].finished);
}

TEST(CriticalZoneTest, RunsCallbackUnderLock) {
	std::mutex mutex;
	int value = 0;
	parallel::CriticalZone::run(mutex, [&value]() { value = 42; });
	EXPECT_EQ(42, value);
	EXPECT_TRUE(mutex.try_lock());
	mutex.unlock();
}
