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
#include "datanode/namespace_slice_registry.h"

namespace storage {

NamespaceSliceRegistry::SlicePtr NamespaceSliceRegistry::attach(int32_t namespaceId,
                                                                SlicePtr slice) {
	std::scoped_lock<std::mutex> const lock(mutex_);
	// emplace keeps the slice already registered
	auto it = slices_.emplace(namespaceId, std::move(slice)).first;
	return it->second;
}

bool NamespaceSliceRegistry::detach(int32_t namespaceId) {
	std::scoped_lock<std::mutex> const lock(mutex_);
	return slices_.erase(namespaceId) > 0;
}

NamespaceSliceRegistry::SlicePtr NamespaceSliceRegistry::lookup(int32_t namespaceId) const {
	std::scoped_lock<std::mutex> const lock(mutex_);
	auto it = slices_.find(namespaceId);
	if (it == slices_.end()) {
		return nullptr;
	}
	return it->second;
}

std::vector<int32_t> NamespaceSliceRegistry::namespaceIds() const {
	std::scoped_lock<std::mutex> const lock(mutex_);
	std::vector<int32_t> ids;
	ids.reserve(slices_.size());
	for (const auto &[namespaceId, slice] : slices_) {
		ids.push_back(namespaceId);
	}
	return ids;
}

size_t NamespaceSliceRegistry::size() const {
	std::scoped_lock<std::mutex> const lock(mutex_);
	return slices_.size();
}

}  // namespace storage
