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

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include "common/exception.h"
#include "common/random.h"
#include "common/run_tab.h"
#include "config/cfg.h"
#include "datanode/data_storage.h"
#include "datanode/storage-common/storage_utils.h"
#include "datanode/storage-common/upgrade_manager.h"
#include "metrics/metrics.h"
#include "slogger/slogger.h"

namespace {

const std::string kDefaultConfigFile = ETC_PATH "/kestrelfs-datanode.cfg";
const std::string kDefaultDataDirsFile = ETC_PATH "/kestrelfs-data-dirs.cfg";
constexpr int kDefaultLogFileCount = 5;

struct AdminOptions {
	std::string configFile;
	storage::NamespaceDescriptor nsInfo;
	storage::StartupOption startupOption = storage::StartupOption::kRegular;
	bool finalize = false;
	bool addNamespace = false;
	bool dumpConfig = false;
};

/// Returns false when the program should stop right away (--help).
bool parseOptions(int argc, char **argv, AdminOptions &options) {
	namespace po = boost::program_options;

	// clang-format off
	po::options_description generic("options");
	generic.add_options()
		("help,h", "produce help message")
		("config,c", po::value<std::string>()->default_value(kDefaultConfigFile),
		 "configuration file")
		("dump-config", po::bool_switch(), "print the loaded configuration as YAML and exit");

	po::options_description transition("Storage transition");
	transition.add_options()
		("namespace-id,n", po::value<int32_t>()->required(), "namespace id of the cluster")
		("ctime", po::value<int64_t>()->default_value(0), "creation time of the namespace")
		("layout-version", po::value<int32_t>()->default_value(storage::kCurrentLayoutVersion),
		 "layout version reported by the namespace")
		("format", po::bool_switch(), "format every storage directory")
		("rollback", po::bool_switch(), "restore the snapshot of every storage directory")
		("finalize", po::bool_switch(), "discard the snapshots after the transition")
		("add-namespace", po::bool_switch(), "attach the namespace slices as well");
	// clang-format on

	po::options_description visible("Allowed options");
	visible.add(generic).add(transition);

	po::variables_map variableMap;
	po::store(po::parse_command_line(argc, argv, visible), variableMap);

	if (variableMap.count("help") != 0) {
		std::cout << visible << "\n";
		return false;
	}
	options.configFile = variableMap["config"].as<std::string>();
	options.dumpConfig = variableMap["dump-config"].as<bool>();
	if (options.dumpConfig) {
		return true;
	}

	po::notify(variableMap);

	bool format = variableMap["format"].as<bool>();
	bool rollback = variableMap["rollback"].as<bool>();
	if (format && rollback) {
		throw po::error("--format and --rollback are mutually exclusive");
	}
	if (format) {
		options.startupOption = storage::StartupOption::kFormat;
	} else if (rollback) {
		options.startupOption = storage::StartupOption::kRollback;
	}

	options.nsInfo.namespaceId = variableMap["namespace-id"].as<int32_t>();
	options.nsInfo.creationTime = variableMap["ctime"].as<int64_t>();
	options.nsInfo.layoutVersion = variableMap["layout-version"].as<int32_t>();
	options.finalize = variableMap["finalize"].as<bool>();
	options.addNamespace = variableMap["add-namespace"].as<bool>();
	return true;
}

int initLogging() {
	auto level = ksfs::log_level_from_string(cfg_getstring("LOG_LEVEL", "info"));
	if (!level) {
		ksfs::log_err("{}", level.error());
		return -1;
	}

	ksfs::drop_all_logs();
	ksfs::add_log_stderr(*level);
	auto logFile = cfg_getstring("LOG_FILE", "");
	if (!logFile.empty()) {
		auto maxSize = cfg_get_size("LOG_FILE_MAX_SIZE", "10MiB");
		auto fileCount = cfg_get_minmaxvalue<int32_t>("LOG_FILE_COUNT", kDefaultLogFileCount, 1,
		                                              1000);
		if (maxSize <= 0 ||
		    !ksfs::add_log_file(logFile.c_str(), *level, static_cast<int>(maxSize), fileCount)) {
			ksfs::log_err("can't open log file {}", logFile);
			return -1;
		}
	}
	ksfs::set_log_flush_on(ksfs::log_level::err);
	return 0;
}

int initMetrics() {
	auto host = cfg_getstring("METRICS_HOST", "");
	if (!host.empty()) {
		metrics::init(host.c_str());
	}
	return 0;
}

void printResults(const std::string &title,
                  const std::vector<storage::TransitionResult> &results) {
	std::cout << title << ":\n";
	for (const auto &result : results) {
		std::cout << fmt::format("  {}: {}", result.root, storage::toString(result.kind));
		if (!result.cause.empty()) {
			std::cout << " (" << result.cause << ")";
		}
		std::cout << "\n";
	}
}

int runTransition(const AdminOptions &options) {
	std::vector<std::filesystem::path> dataDirs;
	for (const auto &root :
	     storage::readDataDirsConfig(cfg_getstring("DATA_DIRS_CONF_FILENAME", kDefaultDataDirsFile))) {
		dataDirs.emplace_back(root);
	}

	storage::DefaultUpgradeManager upgradeManager;
	storage::DataStorage dataStorage(upgradeManager);
	const auto namespaceId = options.nsInfo.namespaceId;
	try {
		dataStorage.recoverTransitionRead(options.nsInfo, dataDirs, options.startupOption);
		if (options.addNamespace) {
			dataStorage.recoverTransitionRead(namespaceId, options.nsInfo, dataDirs,
			                                  options.startupOption);
		}
		if (options.finalize) {
			if (options.addNamespace) {
				dataStorage.finalizeUpgrade(namespaceId);
			} else {
				dataStorage.finalizeUpgrade();
			}
			dataStorage.waitForFinalize();
		}
	} catch (const Exception &e) {
		ksfs::log_err("storage transition failed: {}", e.what());
		printResults("storage directories", dataStorage.lastTransitionResults());
		return EXIT_FAILURE;
	}

	printResults("storage directories", dataStorage.lastTransitionResults());
	if (auto slice = dataStorage.namespaceStorage(namespaceId)) {
		printResults(fmt::format("namespace {} slices", namespaceId),
		             slice->lastTransitionResults());
	}
	if (!dataStorage.isInitialized()) {
		return EXIT_FAILURE;
	}
	std::cout << "storage id: " << dataStorage.storageId() << "\n";
	return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char **argv) {
	ksfs::add_log_stderr(ksfs::log_level::info);

	AdminOptions options;
	try {
		if (!parseOptions(argc, argv, options)) {
			return EXIT_SUCCESS;
		}
	} catch (const boost::program_options::error &e) {
		ksfs::log_err("{}", e.what());
		return EXIT_FAILURE;
	}

	std::vector<RunTab> initTab = {
	    {[&options]() { return cfg_load(options.configFile.c_str(), 0); }, "configuration"},
	    {initLogging, "logging"},
	    {rnd_init, "random generator"},
	    {initMetrics, "metrics"},
	};
	auto failed = run_tab_execute(initTab);
	if (!failed.empty()) {
		ksfs::log_err("init: {} failed", failed);
		return EXIT_FAILURE;
	}

	if (options.dumpConfig) {
		std::cout << cfg_yaml_string("datanode") << "\n";
		cfg_term();
		return EXIT_SUCCESS;
	}

	int status = EXIT_FAILURE;
	try {
		status = runTransition(options);
	} catch (const Exception &e) {
		ksfs::log_err("{}", e.what());
	} catch (const std::filesystem::filesystem_error &e) {
		ksfs::log_err("{}", e.what());
	}

	metrics::destroy();
	cfg_term();
	return status;
}
