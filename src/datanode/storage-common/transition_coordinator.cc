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
#include "datanode/storage-common/transition_coordinator.h"

#include <fmt/format.h>

#include "datanode/storage-common/storage_exceptions.h"
#include "datanode/storage-common/storage_utils.h"
#include "metrics/metrics.h"
#include "slogger/slogger.h"

namespace storage {

namespace {

std::string describeError(const std::exception_ptr &error) {
	try {
		std::rethrow_exception(error);
	} catch (const std::exception &e) {
		return e.what();
	}
}

}  // namespace

TransitionCoordinator::TransitionCoordinator(IUpgradeManager &upgradeManager)
    : upgradeManager_(upgradeManager) {}

bool TransitionCoordinator::isUpgradeRequired(const StorageInfo &info,
                                              const NamespaceDescriptor & /*nsInfo*/) const {
	return info.layoutVersion > kCurrentLayoutVersion;
}

void TransitionCoordinator::markResult(const StorageDirectory &directory,
                                       TransitionResult::Kind kind, const std::string &cause) {
	const auto rootName = directory.root().string();
	for (auto &result : results_) {
		if (result.root == rootName) {
			// The first change made to a directory is the one reported.
			if (result.kind == TransitionResult::Kind::kUnchanged) {
				result.kind = kind;
				result.cause = cause;
			}
			return;
		}
	}
	results_.push_back(TransitionResult{rootName, kind, cause});
}

void TransitionCoordinator::probeDirectories(const std::vector<std::filesystem::path> &roots,
                                             const NamespaceDescriptor &nsInfo,
                                             StartupOption option) {
	// Abandoned workers still reference the directories about to be dropped.
	joinAbandonedRollbacks();
	stopSource_ = std::stop_source{};
	directories_.clear();
	results_.clear();

	for (const auto &root : roots) {
		auto directory = std::make_unique<StorageDirectory>(root);
		std::vector<const StorageDirectory *> siblings;
		for (const auto &sibling : directories_) {
			siblings.push_back(sibling.get());
		}

		auto kind = TransitionResult::Kind::kUnchanged;
		try {
			auto state = directory->analyze(option, siblings);
			switch (state) {
			case StorageState::kNormal:
				break;
			case StorageState::kNonExistent:
				ksfs::log_warn("Storage directory {} does not exist", root.string());
				results_.push_back(
				    TransitionResult{directory->root().string(),
				                     TransitionResult::Kind::kFailed, "does not exist"});
				metrics::Counter::increment(metrics::Counter::DIRS_EXCLUDED);
				continue;
			case StorageState::kNotFormatted:
				ksfs::log_info("Storage directory {} is not formatted, formatting", root.string());
				format(*directory, nsInfo);
				kind = TransitionResult::Kind::kFormatted;
				metrics::Counter::increment(metrics::Counter::DIRS_FORMATTED);
				break;
			default:
				directory->recover(state);
			}
		} catch (const std::exception &e) {
			directory->unlock();
			ksfs::log_warn("Ignoring storage directory {}: {}", root.string(), e.what());
			results_.push_back(TransitionResult{directory->root().string(),
			                                    TransitionResult::Kind::kFailed, e.what()});
			metrics::Counter::increment(metrics::Counter::DIRS_EXCLUDED);
			continue;
		}

		results_.push_back(TransitionResult{directory->root().string(), kind, {}});
		directories_.push_back(std::move(directory));
	}

	if (directories_.empty()) {
		throw StorageException("All specified directories are not accessible or do not exist.");
	}
}

void TransitionCoordinator::joinAbandonedRollbacks() {
	for (auto &group : abandonedRollbacks_) {
		for (const auto &result : group->joinAll()) {
			if (result.failed()) {
				ksfs::log_err("Interrupted rollback of {} failed: {}", result.name,
				              describeError(result.error));
			} else {
				ksfs::log_info("Interrupted rollback of {} has finished", result.name);
			}
		}
	}
	abandonedRollbacks_.clear();
}

bool TransitionCoordinator::doTransition(const NamespaceDescriptor &nsInfo,
                                         StartupOption option) {
	if (option == StartupOption::kRollback && !doRollback(nsInfo)) {
		return false;
	}

	std::vector<UpgradeCandidate> candidates;
	for (auto &directory : directories_) {
		const auto rootName = directory->root().string();
		auto info = readStorageInfo(*directory, nsInfo);

		if (info.layoutVersion > kLastUpgradableLayoutVersion) {
			throw IncorrectVersionException(fmt::format(
			    "{}: Unsupported layout version {}, only versions {} and older can be upgraded",
			    rootName, info.layoutVersion, kLastUpgradableLayoutVersion));
		}
		if (info.layoutVersion < kCurrentLayoutVersion) {
			throw IncorrectVersionException(fmt::format(
			    "{}: Future version is not allowed: LV = {}, this build handles LV = {}",
			    rootName, info.layoutVersion, kCurrentLayoutVersion));
		}
		if (isNamespaceIdChecked(info) && info.namespaceId != nsInfo.namespaceId) {
			directory->unlock();
			throw NamespaceMismatchException(fmt::format(
			    "Incompatible namespaceIDs in {}: namenode namespaceID = {}; "
			    "datanode namespaceID = {}",
			    rootName, nsInfo.namespaceId, info.namespaceId));
		}

		if (info.layoutVersion == kCurrentLayoutVersion &&
		    info.creationTime == nsInfo.creationTime) {
			continue;  // regular startup
		}

		upgradeManager_.verifyDistributedUpgradeProgress(nsInfo);
		if (isUpgradeRequired(info, nsInfo)) {
			candidates.push_back(UpgradeCandidate{directory.get(), info});
			continue;
		}
		if (info.creationTime >= nsInfo.creationTime) {
			directory->unlock();
			throw InconsistentStateException(fmt::format(
			    "{}: Datanode state: {} is newer than the namespace state: {}", rootName,
			    describeState(info.layoutVersion, info.creationTime),
			    describeState(nsInfo.layoutVersion, nsInfo.creationTime)));
		}
	}

	if (!candidates.empty()) {
		doUpgrade(candidates, nsInfo);
	}
	return true;
}

void TransitionCoordinator::doUpgrade(const std::vector<UpgradeCandidate> &candidates,
                                      const NamespaceDescriptor &nsInfo) {
	parallel::WorkerGroup group;
	std::vector<std::unique_ptr<UpgradeWorker>> workers;
	for (const auto &candidate : candidates) {
		workers.push_back(std::make_unique<UpgradeWorker>(*candidate.directory, level(),
		                                                  candidate.info, nsInfo));
		auto *worker = workers.back().get();
		group.spawn(candidate.directory->root().string(), [worker]() { worker->run(); });
	}

	// Every worker finishes before any failure is looked at.
	auto results = group.joinAll();
	std::string firstFailure;
	for (size_t i = 0; i < results.size(); ++i) {
		if (!results[i].failed()) {
			continue;
		}
		auto cause = describeError(results[i].error);
		ksfs::log_err("Upgrade of {} failed: {}", results[i].name, cause);
		markResult(*candidates[i].directory, TransitionResult::Kind::kFailed, cause);
		if (firstFailure.empty()) {
			firstFailure = fmt::format("Upgrade of {} failed: {}", results[i].name, cause);
		}
	}
	if (!firstFailure.empty()) {
		throw TransitionFailedException(firstFailure);
	}

	StorageInfo upgraded{kCurrentLayoutVersion, nsInfo.namespaceId, nsInfo.creationTime};
	for (const auto &candidate : candidates) {
		auto &directory = *candidate.directory;
		writeStorageInfo(directory, upgraded);
		throwOnError(renameDirectory(directory.previousTmpDir(), directory.previousDir()),
		             "can't keep the snapshot of " + directory.root().string());
		markResult(directory, TransitionResult::Kind::kUpgraded);
		metrics::Counter::increment(metrics::Counter::DIRS_UPGRADED);
		ksfs::log_info("Upgrade of {} is complete.", directory.root().string());
	}
}

bool TransitionCoordinator::doRollback(const NamespaceDescriptor &nsInfo) {
	auto group = std::make_unique<parallel::WorkerGroup>();
	std::vector<std::shared_ptr<RollbackWorker>> workers;
	for (auto &directory : directories_) {
		auto worker = std::make_shared<RollbackWorker>(*directory, level(), nsInfo);
		workers.push_back(worker);
		group->spawn(directory->root().string(), [worker]() { worker->run(); });
	}

	std::vector<parallel::TaskResult> results;
	bool completed = group->joinAll(stopSource_.get_token(), results);
	if (!completed) {
		ksfs::log_warn("Rollback interrupted, {} directories left to their workers",
		               group->size());
		abandonedRollbacks_.push_back(std::move(group));
	}

	std::string firstFailure;
	for (size_t i = 0; i < results.size(); ++i) {
		if (!results[i].finished) {
			continue;
		}
		if (results[i].failed()) {
			auto cause = describeError(results[i].error);
			ksfs::log_err("Rollback of {} failed: {}", results[i].name, cause);
			markResult(workers[i]->directory(), TransitionResult::Kind::kFailed, cause);
			if (firstFailure.empty()) {
				firstFailure = fmt::format("Rollback of {} failed: {}", results[i].name, cause);
			}
		} else if (workers[i]->rolledBack()) {
			markResult(workers[i]->directory(), TransitionResult::Kind::kRolledBack);
		}
	}
	if (!firstFailure.empty()) {
		throw TransitionFailedException(firstFailure);
	}
	return completed;
}

int TransitionCoordinator::finalizeAll(AsyncDirectoryRemover &remover) {
	int finalized = 0;
	for (const auto &directory : directories_) {
		if (finalizeDirectory(*directory, info_, remover)) {
			++finalized;
		}
	}
	return finalized;
}

void TransitionCoordinator::unlockAll() {
	for (auto &directory : directories_) {
		directory->unlock();
	}
}

}  // namespace storage
