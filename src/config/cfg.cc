/*
   Copyright 2005-2010 Jakub Kruszona-Zawadzki, Gemius SA
   Copyright 2013-2014 EditShare
   Copyright 2013-2015 Skytechnology sp. z o.o.
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

#include "common/platform.h"

#include "cfg.h"

#include <algorithm>
#include <cinttypes>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <map>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

static std::string cfgfname;
static std::map<std::string, std::string> configParameters;
static int logundefined = 0;

static std::string trimSpaces(const std::string &str) {
	auto start = str.begin();
	while (start != str.end() && (std::isspace(*start) != 0)) {
		start++;
	}

	auto end = str.rbegin();
	while (end != str.rend() && (std::isspace(*end) != 0)) {
		end++;
	}

	if (start >= end.base()) {
		return {};
	}
	return std::string(start, end.base());
}

static bool isValidKey(const std::string &key) {
	return !key.empty() && std::all_of(key.begin(), key.end(), [](char c) {
		return std::isupper(c) != 0 || std::isdigit(c) != 0 || c == '_';
	});
}

static int cfg_do_load(void) {
	std::ifstream file(cfgfname);

	if (!file.is_open()) {
		ksfs_pretty_syslog(LOG_ERR, "can't load config file: %s", cfgfname.c_str());
		return 1;
	}

	std::string line;
	while (std::getline(file, line)) {
		auto definition = trimSpaces(line);
		if (definition.empty() || definition.front() == '#') {
			continue;
		}

		auto separator = definition.find('=');
		if (separator == std::string::npos) {
			ksfs_pretty_syslog(LOG_WARNING, "bad definition in config file '%s': %s",
			                   cfgfname.c_str(), line.c_str());
			continue;
		}

		auto key = trimSpaces(definition.substr(0, separator));
		auto value = definition.substr(separator + 1);
		auto comment = value.find('#');
		if (comment != std::string::npos) {
			value.erase(comment);
		}
		value = trimSpaces(value);

		if (!isValidKey(key) || value.empty()) {
			ksfs_pretty_syslog(LOG_WARNING, "bad definition in config file '%s': %s",
			                   cfgfname.c_str(), line.c_str());
			continue;
		}
		configParameters[key] = value;
	}
	return 0;
}

int cfg_load(const char *configfname, int _lu) {
	logundefined = _lu;
	cfgfname = configfname;

	return cfg_do_load();
}

std::string cfg_filename() {
	return cfgfname;
}

int cfg_isdefined(const char *name) {
	return configParameters.count(name);
}

void cfg_term(void) {
	configParameters.clear();
	cfgfname.clear();
}

std::string cfg_yaml_string(const std::string &service_name) {
	YAML::Emitter config;
	config << YAML::BeginMap;
	config << YAML::Key << service_name;
	config << YAML::Value;
	config << YAML::BeginMap;
	for (const auto &[key, val] : configParameters) {
		config << YAML::Key << key << YAML::Value << val;
	}
	config << YAML::EndMap;
	config << YAML::EndMap;
	return config.c_str();
}

int64_t cfg_parse_size(const std::string &str) {
	static const std::unordered_map<std::string, double> units{
	    {"b", 1.0},
	    // base 10
	    {"k", 1e3},
	    {"kb", 1e3},
	    {"m", 1e6},
	    {"mb", 1e6},
	    {"g", 1e9},
	    {"gb", 1e9},
	    {"t", 1e12},
	    {"tb", 1e12},
	    {"p", 1e15},
	    {"pb", 1e15},
	    {"e", 1e18},
	    {"eb", 1e18},
	    // base 2
	    {"ki", 1024.0},
	    {"kib", 1024.0},
	    {"mi", 1048576.0},
	    {"mib", 1048576.0},
	    {"gi", 1073741824.0},
	    {"gib", 1073741824.0},
	    {"ti", 1099511627776.0},
	    {"tib", 1099511627776.0},
	    {"pi", 1125899906842624.0},
	    {"pib", 1125899906842624.0},
	    {"ei", 1152921504606846976.0},
	    {"eib", 1152921504606846976.0}};

	static constexpr double kMaxValue = 9223372036854775807.0;

	auto cleanStr = trimSpaces(str);
	size_t numberEndPosition = 0;
	double value = kInvalidConversion;

	try {
		value = std::stod(cleanStr, &numberEndPosition);
	} catch (const std::invalid_argument &e) {
		return kInvalidConversion;
	} catch (const std::out_of_range &e) {
		return kInvalidConversion;
	}

	if (numberEndPosition < cleanStr.size()) {
		std::string unit = trimSpaces(cleanStr.substr(numberEndPosition));

		std::transform(
		    unit.begin(), unit.end(), unit.begin(),
		    [](unsigned char character) { return std::tolower(character); });

		if (units.contains(unit)) {
			value *= units.at(unit);
		} else {
			return kInvalidConversion;
		}
	}

	if (value < 0 || value >= kMaxValue) { return kInvalidConversion; }

	return static_cast<int64_t>(std::round(value));
}

int64_t cfg_get_size(const char *name, const std::string &defaultValue) {
	auto value = cfg_parse_size(cfg_getstring(name, defaultValue));
	if (value == kInvalidConversion) {
		ksfs_pretty_syslog(LOG_WARNING, "config value %s is not a valid size, using %s",
		                   name, defaultValue.c_str());
		value = cfg_parse_size(defaultValue);
	}
	return value;
}

#define STR_TO_int32(x) return strtol(x,NULL,0)
#define STR_TO_uint32(x) return strtoul(x,NULL,0)
#define STR_TO_uint64(x) return strtoull(x,NULL,0)
#define STR_TO_string(x) return std::string(x)

#define TOPRINTF_int32(x) x
#define TOPRINTF_uint32(x) x
#define TOPRINTF_uint64(x) x
#define TOPRINTF_string(x) x.c_str()

#define _CONFIG_GEN_FUNCTION(fname,type,convname,format) \
type cfg_get##fname(const char *name, const type def) { \
	auto it = configParameters.find(name); \
	if (it != configParameters.end()) { \
		STR_TO_##convname(it->second.c_str()); \
	} \
	if (logundefined) { \
		ksfs_pretty_syslog(LOG_NOTICE,"config: using default value for option '%s' - '" format "'", \
				name,TOPRINTF_##convname(def)); \
	} \
	return def; \
}

_CONFIG_GEN_FUNCTION(string,std::string,string,"%s")
_CONFIG_GEN_FUNCTION(uint16,uint16_t,uint32,"%" PRIu16)
_CONFIG_GEN_FUNCTION(uint32,uint32_t,uint32,"%" PRIu32)
_CONFIG_GEN_FUNCTION(int32,int32_t,int32,"%" PRId32)
_CONFIG_GEN_FUNCTION(uint64,uint64_t,uint64,"%" PRIu64)
