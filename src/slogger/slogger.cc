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
#include "slogger/slogger.h"

#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
#include <unistd.h>
#include <array>
#include <boost/algorithm/string/case_conv.hpp>
#include <string>
#include <expected>

#include "errors/ksfserr.h"

static ksfs::log_level::LogLevel log_level_from_syslog(int priority) {
	static const std::array<ksfs::log_level::LogLevel, 8> kSyslogToLevel = {{
		ksfs::log_level::critical, // emerg
		ksfs::log_level::critical, // alert
		ksfs::log_level::critical, // critical
		ksfs::log_level::err,      // error
		ksfs::log_level::warn,     // warning
		ksfs::log_level::info,     // notice
		ksfs::log_level::info,     // info
		ksfs::log_level::debug,    // debug
	}};
	return kSyslogToLevel[std::min<int>(priority, kSyslogToLevel.size() - 1)];
}

std::expected<ksfs::log_level::LogLevel, std::string>
ksfs::log_level_from_string(const std::string &level) {
	const auto lower_level = boost::algorithm::to_lower_copy(level);
	if (lower_level == "trace") {
		return ksfs::log_level::trace;
	}
	if (lower_level == "debug") {
		return ksfs::log_level::debug;
	}
	if (lower_level == "info") {
		return ksfs::log_level::info;
	}
	if (lower_level == "warn" || lower_level == "warning") {
		return ksfs::log_level::warn;
	}
	if (lower_level == "err" || lower_level == "error") {
		return ksfs::log_level::err;
	}
	if (lower_level == "crit" || lower_level == "critical") {
		return ksfs::log_level::critical;
	}
	if (lower_level == "off") {
		return ksfs::log_level::off;
	}
	return std::unexpected<std::string>("Invalid log level: " + level);
}

std::string ksfs::log_level_to_string(ksfs::log_level::LogLevel level) {
	using ksfs::log_level::LogLevel;
	switch (level) {
	case LogLevel::trace:
		return "trace";
	case LogLevel::debug:
		return "debug";
	case LogLevel::info:
		return "info";
	case LogLevel::warn:
		return "warn";
	case LogLevel::err:
		return "err";
	case LogLevel::critical:
		return "crit";
	case LogLevel::off:
		break;
	}
	return "off";
}

bool ksfs::add_log_file(const char *path, log_level::LogLevel level, int max_file_size, int max_file_count) {
	try {
		LoggerPtr logger = spdlog::rotating_logger_mt(path, path, max_file_size, max_file_count);
		logger->set_level((spdlog::level::level_enum)level);
		// Format: DATE TIME [LEVEL] [PID:TID] : MESSAGE
		logger->set_pattern("%D %H:%M:%S.%e [%l] [%P:%t] : %v");
		return true;
	} catch (const spdlog::spdlog_ex &e) {
		ksfs_pretty_syslog(LOG_ERR, "Adding %s log file failed: %s", path, e.what());
	}
	return false;
}

void ksfs::set_log_flush_on(log_level::LogLevel level) {
	spdlog::apply_all([level](LoggerPtr l) {l->flush_on((spdlog::level::level_enum)level);});
}

void ksfs::drop_all_logs() {
	spdlog::drop_all();
}

bool ksfs::add_log_syslog() {
	try {
		spdlog::syslog_logger_mt("syslog");
		return true;
	} catch (const spdlog::spdlog_ex &e) {
		ksfs_pretty_syslog(LOG_ERR, "Adding syslog log failed: %s", e.what());
	}
	return false;
}

bool ksfs::add_log_stderr(log_level::LogLevel level) {
	try {
		LoggerPtr logger = spdlog::stderr_color_mt("stderr");
		logger->set_level((spdlog::level::level_enum)level);
		// Format: DATE TIME [LEVEL] [PID:TID] : MESSAGE
		logger->set_pattern("%D %H:%M:%S.%e [%l] [%P:%t] : %v");
		return true;
	} catch (const spdlog::spdlog_ex &e) {
		ksfs_pretty_syslog(LOG_ERR, "Adding stderr log failed: %s", e.what());
	}
	return false;
}

static void ksfs_vsyslog(int priority, const char* format, va_list ap) {
	char buf[1024];
	va_list ap2;
	va_copy(ap2, ap);
	int written = vsnprintf(buf, sizeof(buf), format, ap2);
	va_end(ap2);
	if (written < 0) {
		return;
	}

	spdlog::apply_all([priority, &buf](LoggerPtr l) {
		l->log((spdlog::level::level_enum)log_level_from_syslog(priority), buf);
	});
}

void ksfs_pretty_syslog(int priority, const char* format, ...) {
	va_list ap;
	va_start(ap, format);
	ksfs_vsyslog(priority, format, ap);
	va_end(ap);
}

void ksfs_pretty_errlog(int priority, const char* format, ...) {
	int err = errno;
	char buffer[1024];
	va_list ap;
	va_start(ap, format);
	int len = vsnprintf(buffer, sizeof(buffer), format, ap);
	va_end(ap);
	if (len < 0) {
		buffer[0] = '\0';
	}
	ksfs_pretty_syslog(priority, "%s: %s", buffer, strerr(err));
	errno = err;
}
