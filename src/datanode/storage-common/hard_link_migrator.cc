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
#include "datanode/storage-common/hard_link_migrator.h"

#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <regex>

#include <fmt/format.h>

#include "datanode/storage-common/storage_exceptions.h"
#include "datanode/storage-common/storage_utils.h"
#include "errors/kestrelfs_error_codes.h"
#include "errors/ksfserr.h"

namespace storage {

namespace {

bool startsWith(const std::string &name, const std::string &prefix) {
	return name.compare(0, prefix.size(), prefix) == 0;
}

/// Entries worth mirroring, everything else in a block directory is ignored.
/// VERSION records are left to the caller, a migrated tree gets its record
/// only when the migration is committed.
bool isLinkable(const std::string &name) {
	return startsWith(name, kBlockSubdirPrefix) || startsWith(name, kBlockFilePrefix) ||
	       startsWith(name, kStagedCopyFilePrefix);
}

std::vector<std::string> listSorted(const fs::path &directory) {
	std::vector<std::string> names;
	std::error_code errorCode;
	for (fs::directory_iterator it(directory, errorCode), end; !errorCode && it != end;
	     it.increment(errorCode)) {
		names.push_back(it->path().filename().string());
	}
	if (errorCode) {
		throw StorageException("can't list " + directory.string() + ": " + errorCode.message(),
		                       kestrelfs_status_from_errno(errorCode.value()));
	}
	std::sort(names.begin(), names.end());
	return names;
}

class DirectoryDescriptor {
public:
	explicit DirectoryDescriptor(const fs::path &path)
	    : fd_(::open(path.c_str(), O_RDONLY | O_DIRECTORY)) {
		if (fd_ < 0) {
			int err = errno;
			throw StorageException("can't open directory " + path.string() + ": " + strerr(err),
			                       kestrelfs_status_from_errno(err));
		}
	}

	DirectoryDescriptor(const DirectoryDescriptor &) = delete;
	DirectoryDescriptor &operator=(const DirectoryDescriptor &) = delete;

	~DirectoryDescriptor() { ::close(fd_); }

	int get() const { return fd_; }

private:
	int fd_;
};

}  // namespace

LinkStatistics &LinkStatistics::operator+=(const LinkStatistics &other) {
	directories += other.directories;
	emptyDirectories += other.emptyDirectories;
	singleLinks += other.singleLinks;
	multiLinkOperations += other.multiLinkOperations;
	filesInMultiLinks += other.filesInMultiLinks;
	physicalCopies += other.physicalCopies;
	return *this;
}

std::string LinkStatistics::report() const {
	return fmt::format(
	    "HardLinkStats: {} Directories, including {} Empty Directories, {} single Link "
	    "operations, {} multi-Link operations, linking {} files, total {} linkable files. "
	    "Also physically copied {} other files.",
	    directories, emptyDirectories, singleLinks, multiLinkOperations, filesInMultiLinks,
	    singleLinks + filesInMultiLinks, physicalCopies);
}

HardLinkMigrator::HardLinkMigrator(LayoutVersion sourceLayoutVersion)
    : sourceLayoutVersion_(sourceLayoutVersion) {}

bool HardLinkMigrator::needsMetaRename() const {
	return sourceLayoutVersion_ >= kPreGenerationStampLayoutVersion;
}

std::string HardLinkMigrator::convertMetaFileName(const std::string &name) {
	static const std::regex kPreGenerationStampMeta(R"(^(.*blk_-*\d+)\.meta$)");
	std::smatch match;
	if (std::regex_match(name, match, kPreGenerationStampMeta)) {
		return fmt::format("{}_{}.meta", match[1].str(), kGrandfatherGenerationStamp);
	}
	return name;
}

bool HardLinkMigrator::isCopiedPhysically(const std::string &name) {
	return startsWith(name, kStagedCopyFilePrefix);
}

void HardLinkMigrator::linkBlocks(const fs::path &from, const fs::path &to,
                                  bool createDestination) {
	std::error_code errorCode;
	if (fs::is_directory(from, errorCode)) {
		linkDirectory(from, to, createDestination);
		return;
	}
	linkFile(from, to);
}

void HardLinkMigrator::linkFile(const fs::path &from, const fs::path &to) {
	if (isCopiedPhysically(from.filename().string())) {
		throwOnError(copyFile(from, to), "can't copy " + from.string());
		++stats_.physicalCopies;
		return;
	}

	auto destination = to;
	if (needsMetaRename()) {
		destination = to.parent_path() / convertMetaFileName(to.filename().string());
	}
	if (::link(from.c_str(), destination.c_str()) < 0) {
		int err = errno;
		throw StorageException(fmt::format("can't link {} to {}: {}", from.string(),
		                                   destination.string(), strerr(err)),
		                       kestrelfs_status_from_errno(err));
	}
	++stats_.singleLinks;
}

void HardLinkMigrator::linkDirectory(const fs::path &from, const fs::path &to,
                                     bool createDestination) {
	++stats_.directories;
	if (createDestination) {
		throwOnError(createDirectory(to), "can't create directory " + to.string());
	}

	std::vector<std::string> entries;
	for (auto &name : listSorted(from)) {
		if (isLinkable(name)) {
			entries.push_back(std::move(name));
		}
	}
	if (entries.empty()) {
		++stats_.emptyDirectories;
		return;
	}

	if (needsMetaRename()) {
		for (const auto &name : entries) {
			linkBlocks(from / name, to / name, true);
		}
		return;
	}

	std::vector<std::string> blockFiles;
	std::vector<std::string> others;
	for (auto &name : entries) {
		std::error_code errorCode;
		if (startsWith(name, kBlockFilePrefix) && fs::is_regular_file(from / name, errorCode)) {
			blockFiles.push_back(std::move(name));
		} else {
			others.push_back(std::move(name));
		}
	}

	if (!blockFiles.empty()) {
		linkAll(from, to, blockFiles);
		++stats_.multiLinkOperations;
		stats_.filesInMultiLinks += blockFiles.size();
	}
	for (const auto &name : others) {
		linkBlocks(from / name, to / name, true);
	}
}

void HardLinkMigrator::linkAll(const fs::path &fromDir, const fs::path &toDir,
                               const std::vector<std::string> &names) {
	DirectoryDescriptor source(fromDir);
	DirectoryDescriptor destination(toDir);
	for (const auto &name : names) {
		if (::linkat(source.get(), name.c_str(), destination.get(), name.c_str(), 0) < 0) {
			int err = errno;
			throw StorageException(fmt::format("can't link {} into {}: {}",
			                                   (fromDir / name).string(), toDir.string(),
			                                   strerr(err)),
			                       kestrelfs_status_from_errno(err));
		}
	}
}

}  // namespace storage
