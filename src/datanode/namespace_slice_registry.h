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
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "datanode/namespace_slice_storage.h"

namespace storage {

/**
 * @brief Namespace slices attached to this node, keyed by namespace id.
 *
 * Every access is serialized by one mutex. Handles returned by lookup()
 * remain valid after the slice is detached.
 */
class NamespaceSliceRegistry {
public:
	using SlicePtr = std::shared_ptr<NamespaceSliceStorage>;

	NamespaceSliceRegistry() = default;

	// No need to copy or move them so far
	NamespaceSliceRegistry(const NamespaceSliceRegistry &) = delete;
	NamespaceSliceRegistry(NamespaceSliceRegistry &&) = delete;
	NamespaceSliceRegistry &operator=(const NamespaceSliceRegistry &) = delete;
	NamespaceSliceRegistry &operator=(NamespaceSliceRegistry &&) = delete;

	/**
	 * @brief Registers `slice` under `namespaceId` unless a slice is already
	 * registered there.
	 * @return The slice registered under `namespaceId` after the call.
	 */
	SlicePtr attach(int32_t namespaceId, SlicePtr slice);

	/// Removes the slice of `namespaceId`. Returns false if there was none.
	bool detach(int32_t namespaceId);

	/// Returns the slice of `namespaceId` or nullptr.
	SlicePtr lookup(int32_t namespaceId) const;

	/// Attached namespace ids in increasing order.
	std::vector<int32_t> namespaceIds() const;

	size_t size() const;

private:
	mutable std::mutex mutex_;
	std::map<int32_t, SlicePtr> slices_;
};

}  // namespace storage
