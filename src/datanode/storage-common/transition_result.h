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

#include <string>

namespace storage {

/// Outcome of one storage directory in the last transition pass.
struct TransitionResult {
	enum class Kind {
		kUnchanged,   ///< Regular startup, possibly after finishing a recovery.
		kFormatted,
		kUpgraded,
		kRolledBack,
		kFailed,      ///< Excluded or failed, see cause.
	};

	std::string root;
	Kind kind = Kind::kUnchanged;
	std::string cause;
};

inline std::string toString(TransitionResult::Kind kind) {
	switch (kind) {
	case TransitionResult::Kind::kUnchanged:
		return "unchanged";
	case TransitionResult::Kind::kFormatted:
		return "formatted";
	case TransitionResult::Kind::kUpgraded:
		return "upgraded";
	case TransitionResult::Kind::kRolledBack:
		return "rolled back";
	case TransitionResult::Kind::kFailed:
		return "failed";
	}
	return "unknown";
}

}  // namespace storage
