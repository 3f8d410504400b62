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

#pragma once

#include "common/platform.h"

#include <cstdint>
#include <string>

#include "slogger/slogger.h"

#define _CONFIG_MAKE_PROTOTYPE(fname,type) type cfg_get##fname(const char *name,const type def)

static constexpr int64_t kInvalidConversion = -1;

/// Loads KEY = VALUE definitions from fname. Returns 0 on success.
/// With logundefined set, every default value handed out is logged.
int cfg_load(const char *fname, int logundefined);
void cfg_term(void);

/// Returns the name of the currently loaded config file.
std::string cfg_filename();

/// Returns the current configuration in memory as a YAML string.
/// service_name is the service of the configuration (e.g "datanode") that will
/// be printed in the returned value.
std::string cfg_yaml_string(const std::string &service_name);

/**
 * @brief Parses a string representing a size and converts it to bytes.
 *
 * The function supports suffixes for kilo (K, KB, Ki or KiB) or the same
 * formats for mega, giga, tera, peta and exa. The function is case insensitive.
 *
 * @param str The string to parse.
 * @return The size in bytes as an int64_t. If the string cannot be parsed,
 *         or if the parsed value is larger than the maximum representable
 *         int64_t value, the function returns kInvalidConversion.
 */
int64_t cfg_parse_size(const std::string& str);

int cfg_isdefined(const char *name);

_CONFIG_MAKE_PROTOTYPE(string,std::string);
_CONFIG_MAKE_PROTOTYPE(uint16,uint16_t);
_CONFIG_MAKE_PROTOTYPE(uint32,uint32_t);
_CONFIG_MAKE_PROTOTYPE(int32,int32_t);
_CONFIG_MAKE_PROTOTYPE(uint64,uint64_t);

inline uint16_t cfg_get(const char* name, uint16_t defaultValue) {
	return cfg_getuint16(name, defaultValue);
}

inline uint32_t cfg_get(const char* name, uint32_t defaultValue) {
	return cfg_getuint32(name, defaultValue);
}

inline int32_t cfg_get(const char* name, int32_t defaultValue) {
	return cfg_getint32(name, defaultValue);
}

inline uint64_t cfg_get(const char* name, uint64_t defaultValue) {
	return cfg_getuint64(name, defaultValue);
}

inline std::string cfg_get(const char* name, const std::string defaultValue) {
	return cfg_getstring(name, defaultValue);
}

/// Reads a size option ("10MiB", "4G", ...). Falls back to the default when
/// the value does not parse.
int64_t cfg_get_size(const char *name, const std::string &defaultValue);

template <class T>
T cfg_get_minmaxvalue(const char* name, T defaultValue, T minValue, T maxValue) {
	T configValue = cfg_get(name, defaultValue);
	if (configValue < minValue) {
		ksfs_pretty_syslog(LOG_WARNING, "config value %s was set to %s, but minimal value is %s - increasing",
				name, std::to_string(configValue).c_str(), std::to_string(minValue).c_str());
		configValue = minValue;
	} else if (configValue > maxValue) {
		ksfs_pretty_syslog(LOG_WARNING, "config value %s was set to %s, but maximal value is %s - decreasing",
				name, std::to_string(configValue).c_str(), std::to_string(maxValue).c_str());
		configValue = maxValue;
	}
	return configValue;
}
