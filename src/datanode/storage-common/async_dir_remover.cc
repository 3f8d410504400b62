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
#include "datanode/storage-common/async_dir_remover.h"

#include "datanode/storage-common/storage_utils.h"
#include "errors/kestrelfs_error_codes.h"
#include "slogger/slogger.h"

namespace storage {

void AsyncDirectoryRemover::remove(const std::filesystem::path &directory,
                                   const std::string &owner) {
	++scheduled_;
	workers_->spawn("Finalize " + owner, [directory, owner]() {
		int status = removeDirectory(directory);
		if (status != KESTRELFS_STATUS_OK) {
			ksfs::log_err("Finalize upgrade for {} failed: can't remove {}: {}", owner,
			              directory.string(), kestrelfs_error_string(status));
			return;
		}
		ksfs::log_info("Finalize upgrade for {} is complete.", owner);
	});
}

void AsyncDirectoryRemover::waitForAll() {
	if (workers_->size() == 0) {
		return;
	}
	workers_->joinAll();
	workers_ = std::make_unique<parallel::WorkerGroup>();
}

}  // namespace storage
