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

#include <algorithm>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wstringop-overflow"
#pragma GCC diagnostic ignored "-Wstringop-overread"
#include <boost/container/small_vector.hpp>
#pragma GCC diagnostic pop
#include <cstddef>
#include <initializer_list>

// Wrapper around boost::container::small_vector adding the initializer list
// constructor the boost version lacks.
template <typename T, size_t N = 8>
class small_vector : public boost::container::small_vector<T, N> {
public:
	using base = boost::container::small_vector<T, N>;
	using size_type = base::size_type;
	using value_type = base::value_type;

	small_vector() : base() {}

	explicit small_vector(size_type n) : base(n) {}

	small_vector(std::initializer_list<T> initializerList) {
		base::reserve(std::max(N, initializerList.size()));
		base::insert(base::end(), initializerList);
	}
};
