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

#include <functional>
#include <string>
#include <vector>

/// Simple function prototype for callbacks
using RunTabFunction = std::function<int()>;

/// Structure to pack the function and a descriptive name together
struct RunTab {
	RunTabFunction function;  ///< Actual function to call
	std::string name;         ///< Descriptive name (useful to log errors)
};

/// Calls every entry in order, stops at the first one returning non-zero.
/// Returns the name of the failed entry or an empty string.
inline std::string run_tab_execute(const std::vector<RunTab> &tabs) {
	for (const auto &tab : tabs) {
		if (tab.function() != 0) {
			return tab.name;
		}
	}
	return {};
}
