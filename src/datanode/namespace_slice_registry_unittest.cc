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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "datanode/namespace_slice_registry.h"
#include "unittests/mocks/upgrade_manager_mock.h"

using namespace storage;
using ::testing::ElementsAre;
using ::testing::NiceMock;

class NamespaceSliceRegistryTest : public ::testing::Test {
protected:
	NamespaceSliceRegistry::SlicePtr makeSlice(int32_t namespaceId) {
		return std::make_shared<NamespaceSliceStorage>(namespaceId, upgradeManager_);
	}

	NiceMock<UpgradeManagerMock> upgradeManager_;
	NamespaceSliceRegistry registry_;
};

TEST_F(NamespaceSliceRegistryTest, AttachKeepsExistingSlice) {
	auto first = makeSlice(3);
	auto second = makeSlice(3);

	EXPECT_EQ(registry_.attach(3, first), first);
	EXPECT_EQ(registry_.attach(3, second), first);
	EXPECT_EQ(registry_.lookup(3), first);
	EXPECT_EQ(registry_.size(), 1U);
}

TEST_F(NamespaceSliceRegistryTest, LookupAndDetach) {
	registry_.attach(9, makeSlice(9));
	registry_.attach(2, makeSlice(2));
	registry_.attach(5, makeSlice(5));

	EXPECT_THAT(registry_.namespaceIds(), ElementsAre(2, 5, 9));
	EXPECT_EQ(registry_.lookup(4), nullptr);

	auto slice = registry_.lookup(5);
	ASSERT_NE(slice, nullptr);
	EXPECT_EQ(slice->namespaceId(), 5);

	EXPECT_TRUE(registry_.detach(5));
	EXPECT_FALSE(registry_.detach(5));
	EXPECT_EQ(registry_.lookup(5), nullptr);
	EXPECT_THAT(registry_.namespaceIds(), ElementsAre(2, 9));
	// Handles outlive detaching.
	EXPECT_EQ(slice->namespaceId(), 5);
}

TEST_F(NamespaceSliceRegistryTest, ConcurrentAttachAgreesOnOneSlice) {
	constexpr int kThreads = 8;
	std::vector<NamespaceSliceRegistry::SlicePtr> candidates;
	for (int i = 0; i < kThreads; ++i) {
		candidates.push_back(makeSlice(11));
	}

	std::vector<NamespaceSliceRegistry::SlicePtr> attached(kThreads);
	std::vector<std::thread> threads;
	for (int i = 0; i < kThreads; ++i) {
		threads.emplace_back([&, i]() {
			attached[i] = registry_.attach(11, candidates[i]);
			registry_.lookup(11);
			registry_.namespaceIds();
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}

	ASSERT_EQ(registry_.size(), 1U);
	for (const auto &slice : attached) {
		EXPECT_EQ(slice, registry_.lookup(11));
	}
}
