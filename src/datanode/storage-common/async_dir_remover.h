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

#include <filesystem>
#include <memory>
#include <string>

#include "common/parallel_helpers.h"

namespace storage {

/**
 * @brief Deletes directory trees off the caller's thread.
 *
 * Each removal runs on its own worker. Failures are logged, nothing is
 * reported back to the caller. Pending removals are waited for on
 * destruction.
 */
class AsyncDirectoryRemover {
public:
	AsyncDirectoryRemover() : workers_(std::make_unique<parallel::WorkerGroup>()) {}

	// No need to copy or move them so far
	AsyncDirectoryRemover(const AsyncDirectoryRemover &) = delete;
	AsyncDirectoryRemover(AsyncDirectoryRemover &&) = delete;
	AsyncDirectoryRemover &operator=(const AsyncDirectoryRemover &) = delete;
	AsyncDirectoryRemover &operator=(AsyncDirectoryRemover &&) = delete;

	~AsyncDirectoryRemover() { waitForAll(); }

	/// Schedules removal of `directory`. `owner` names the storage directory
	/// in the log messages.
	void remove(const std::filesystem::path &directory, const std::string &owner);

	/// Blocks until every scheduled removal is done and releases their
	/// workers.
	void waitForAll();

	/// Number of removals scheduled so far.
	size_t scheduled() const { return scheduled_; }

	/// Number of workers not yet released by waitForAll.
	size_t pending() const { return workers_->size(); }

private:
	std::unique_ptr<parallel::WorkerGroup> workers_;
	size_t scheduled_ = 0;
};

}  // namespace storage
