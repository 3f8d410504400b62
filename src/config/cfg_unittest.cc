/*
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

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "config/cfg.h"

TEST(CfgTests, CfgParseSize) {
	// Bytes
	EXPECT_EQ(0, cfg_parse_size("0"));
	EXPECT_EQ(100, cfg_parse_size("100"));
	EXPECT_EQ(1, cfg_parse_size("1"));
	EXPECT_EQ(1, cfg_parse_size("1b"));
	EXPECT_EQ(1, cfg_parse_size("1B"));

	// Kilo
	EXPECT_EQ(1000, cfg_parse_size("1k"));
	EXPECT_EQ(1000, cfg_parse_size("1K"));
	EXPECT_EQ(1024, cfg_parse_size("1Ki"));
	EXPECT_EQ(1024, cfg_parse_size("1kI"));
	EXPECT_EQ(1024, cfg_parse_size("1ki"));
	EXPECT_EQ(1000, cfg_parse_size("1KB"));
	EXPECT_EQ(1000, cfg_parse_size("1kb"));
	EXPECT_EQ(1000, cfg_parse_size("1Kb"));
	EXPECT_EQ(1000, cfg_parse_size("1kB"));
	EXPECT_EQ(1024, cfg_parse_size("1kib"));
	EXPECT_EQ(1024, cfg_parse_size("1KiB"));
	EXPECT_EQ(1024, cfg_parse_size("1kIB"));
	EXPECT_EQ(1024, cfg_parse_size("1kiB"));

	// Giga
	EXPECT_EQ(1000000000, cfg_parse_size("1G"));
	EXPECT_EQ(1000000000, cfg_parse_size("1GB"));
	EXPECT_EQ(1073741824, cfg_parse_size("1Gi"));
	EXPECT_EQ(1073741824, cfg_parse_size("1GiB"));

	// Mega, used for log file sizes
	EXPECT_EQ(10485760, cfg_parse_size("10MiB"));
	EXPECT_EQ(10000000, cfg_parse_size("10M"));

	// With spaces
	EXPECT_EQ(1024, cfg_parse_size("1 KiB"));
	EXPECT_EQ(1024, cfg_parse_size("1KiB "));
	EXPECT_EQ(1024, cfg_parse_size(" 1 KiB "));

	// With dots
	EXPECT_EQ(1024, cfg_parse_size("1.KiB"));
	EXPECT_EQ(512, cfg_parse_size(".5 KiB"));
	EXPECT_EQ(512, cfg_parse_size("0.5 KiB"));
	EXPECT_EQ(1500, cfg_parse_size("1.5K"));

	// Invalid values or suffixes
	EXPECT_EQ(-1, cfg_parse_size(""));
	EXPECT_EQ(-1, cfg_parse_size("1x"));
	EXPECT_EQ(-1, cfg_parse_size("1Bx"));
	EXPECT_EQ(-1, cfg_parse_size("1 KBx"));
	EXPECT_EQ(-1, cfg_parse_size("1_KiB"));
	EXPECT_EQ(-1, cfg_parse_size("-5"));
}

class CfgLoadTest : public ::testing::Test {
protected:
	void SetUp() override {
		configPath_ = std::filesystem::temp_directory_path() / "kestrelfs_cfg_unittest.cfg";
		std::ofstream out(configPath_);
		out << "# datanode settings\n"
		    << "DATA_DIRS_CONF_FILENAME = /etc/kestrelfs/dirs.cfg\n"
		    << "  DATANODE_PORT=9900   # trailing comment\n"
		    << "LOG_FILE_MAX_SIZE = 2MiB\n"
		    << "lowercase = ignored\n"
		    << "NO_VALUE =\n"
		    << "garbage line\n";
	}

	void TearDown() override {
		cfg_term();
		std::filesystem::remove(configPath_);
	}

	std::filesystem::path configPath_;
};

TEST_F(CfgLoadTest, LoadsDefinitions) {
	ASSERT_EQ(0, cfg_load(configPath_.c_str(), 0));
	EXPECT_EQ(configPath_.string(), cfg_filename());
	EXPECT_EQ("/etc/kestrelfs/dirs.cfg", cfg_get("DATA_DIRS_CONF_FILENAME", std::string()));
	EXPECT_EQ(9900U, cfg_get("DATANODE_PORT", uint32_t(1)));
	EXPECT_EQ(2097152, cfg_get_size("LOG_FILE_MAX_SIZE", "1MiB"));
	EXPECT_EQ(0, cfg_isdefined("lowercase"));
	EXPECT_EQ(0, cfg_isdefined("NO_VALUE"));
}

TEST_F(CfgLoadTest, DefaultsAndLimits) {
	ASSERT_EQ(0, cfg_load(configPath_.c_str(), 0));
	EXPECT_EQ(7U, cfg_get("NOT_DEFINED", uint32_t(7)));
	EXPECT_EQ(1000U, cfg_get_minmaxvalue("DATANODE_PORT", uint32_t(1), uint32_t(1), uint32_t(1000)));
	EXPECT_EQ(1048576, cfg_get_size("NOT_DEFINED", "1MiB"));
}

TEST_F(CfgLoadTest, YamlDump) {
	ASSERT_EQ(0, cfg_load(configPath_.c_str(), 0));
	auto yaml = cfg_yaml_string("datanode");
	EXPECT_NE(std::string::npos, yaml.find("datanode:"));
	EXPECT_NE(std::string::npos, yaml.find("DATANODE_PORT: 9900"));
}

TEST_F(CfgLoadTest, MissingFile) {
	EXPECT_NE(0, cfg_load("/nonexistent/kestrelfs.cfg", 0));
}
