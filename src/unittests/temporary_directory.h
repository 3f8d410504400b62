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

#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

#include "common/random.h"

namespace unittests {

namespace fs = std::filesystem;

/// Scratch directory removed with everything in it on destruction.
class TemporaryDirectory {
public:
	explicit TemporaryDirectory(const std::string &prefix)
	    : path_(fs::temp_directory_path() /
	            (prefix + "_" + std::to_string(::getpid()) + "_" +
	             std::to_string(rnd<uint32_t>()))) {
		fs::create_directories(path_);
	}

	TemporaryDirectory(const TemporaryDirectory &) = delete;
	TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

	~TemporaryDirectory() {
		std::error_code errorCode;
		fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, errorCode);
		fs::remove_all(path_, errorCode);
	}

	const fs::path &path() const { return path_; }

private:
	fs::path path_;
};

inline void writeFile(const fs::path &path, const std::string &content) {
	fs::create_directories(path.parent_path());
	std::ofstream(path, std::ios::binary | std::ios::trunc) << content;
}

inline std::string readFile(const fs::path &path) {
	std::ifstream file(path, std::ios::binary);
	std::stringstream content;
	content << file.rdbuf();
	return content.str();
}

/// Relative path of every entry under `root` mapped to the file content,
/// or to "<dir>" for directories. Used to compare whole trees.
inline std::map<std::string, std::string> snapshotTree(const fs::path &root) {
	std::map<std::string, std::string> tree;
	for (const auto &entry : fs::recursive_directory_iterator(root)) {
		auto relative = fs::relative(entry.path(), root).string();
		tree[relative] = entry.is_directory() ? "<dir>" : readFile(entry.path());
	}
	return tree;
}

}  // namespace unittests
