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
#include "datanode/storage-common/version_record.h"

#include <charconv>
#include <fstream>
#include <map>
#include <sstream>

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

#include "datanode/storage-common/storage_exceptions.h"
#include "datanode/storage-common/storage_utils.h"
#include "errors/kestrelfs_error_codes.h"

namespace storage {

namespace {

constexpr const char *kHeader = "#KestrelFS storage version record\n";

constexpr const char *kStorageTypeKey = "storageType";
constexpr const char *kLayoutVersionKey = "layoutVersion";
constexpr const char *kStorageIdKey = "storageID";
constexpr const char *kNamespaceIdKey = "namespaceID";
constexpr const char *kCreationTimeKey = "cTime";

using Properties = std::map<std::string, std::string>;

Properties parseProperties(const std::string &content) {
	Properties properties;
	std::istringstream input(content);
	std::string line;
	while (std::getline(input, line)) {
		boost::algorithm::trim(line);
		if (line.empty() || line.front() == '#' || line.front() == '!') {
			continue;
		}
		auto separator = line.find('=');
		if (separator == std::string::npos) {
			properties[line] = "";
			continue;
		}
		properties[boost::algorithm::trim_copy(line.substr(0, separator))] =
		    boost::algorithm::trim_copy(line.substr(separator + 1));
	}
	return properties;
}

const std::string &requireField(const Properties &properties, const char *key,
                                const std::string &source) {
	auto it = properties.find(key);
	if (it == properties.end()) {
		throw InconsistentStateException(
		    fmt::format("{}: file is incorrectly formatted, field {} is missing", source, key),
		    KESTRELFS_ERROR_PARSE);
	}
	return it->second;
}

template <typename T>
T requireNumber(const Properties &properties, const char *key, const std::string &source) {
	const auto &text = requireField(properties, key, source);
	T value{};
	auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (error != std::errc() || end != text.data() + text.size()) {
		throw InconsistentStateException(
		    fmt::format("{}: field {} has invalid value '{}'", source, key, text),
		    KESTRELFS_ERROR_PARSE);
	}
	return value;
}

void requireStorageType(const Properties &properties, StorageType expected,
                        const std::string &source) {
	const auto &type = requireField(properties, kStorageTypeKey, source);
	if (type != toString(expected)) {
		throw InconsistentStateException(
		    fmt::format("{}: unexpected storage type {}, expected {}", source, type,
		                toString(expected)),
		    KESTRELFS_ERROR_MISMATCH);
	}
}

std::string readWholeFile(const std::filesystem::path &file) {
	std::ifstream input(file, std::ios::binary);
	if (!input.is_open()) {
		throw StorageException("can't open version file " + file.string(),
		                       KESTRELFS_ERROR_ENOENT);
	}
	std::ostringstream content;
	content << input.rdbuf();
	if (input.bad()) {
		throw StorageException("can't read version file " + file.string(), KESTRELFS_ERROR_IO);
	}
	return content.str();
}

}  // namespace

std::string toString(StorageType type) {
	switch (type) {
	case StorageType::kDataNode:
		return "DATA_NODE";
	case StorageType::kNamespaceSlice:
		return "NAMESPACE_SLICE";
	}
	return "UNKNOWN";
}

NodeVersionRecord makeNodeVersionRecord(const StorageInfo &info, const std::string &storageId) {
	if (isPreFederationLayout(info.layoutVersion)) {
		return PreFederationRecord{info.layoutVersion, storageId, info.namespaceId,
		                           info.creationTime};
	}
	return FederationRecord{info.layoutVersion, storageId};
}

LayoutVersion layoutVersionOf(const NodeVersionRecord &record) {
	return std::visit([](const auto &fields) { return fields.layoutVersion; }, record);
}

const std::string &storageIdOf(const NodeVersionRecord &record) {
	return std::visit([](const auto &fields) -> const std::string & { return fields.storageId; },
	                  record);
}

StorageInfo storageInfoOf(const NodeVersionRecord &record, const StorageInfo &fallback) {
	if (const auto *preFederation = std::get_if<PreFederationRecord>(&record)) {
		return StorageInfo{preFederation->layoutVersion, preFederation->namespaceId,
		                   preFederation->creationTime};
	}
	return StorageInfo{layoutVersionOf(record), fallback.namespaceId, fallback.creationTime};
}

std::string VersionRecordCodec::encode(const NodeVersionRecord &record) {
	std::string content = kHeader;
	if (const auto *preFederation = std::get_if<PreFederationRecord>(&record)) {
		content += fmt::format("{}={}\n", kNamespaceIdKey, preFederation->namespaceId);
		content += fmt::format("{}={}\n", kCreationTimeKey, preFederation->creationTime);
	}
	content += fmt::format("{}={}\n", kStorageIdKey, storageIdOf(record));
	content += fmt::format("{}={}\n", kStorageTypeKey, toString(StorageType::kDataNode));
	content += fmt::format("{}={}\n", kLayoutVersionKey, layoutVersionOf(record));
	return content;
}

std::string VersionRecordCodec::encode(const NamespaceSliceRecord &record) {
	std::string content = kHeader;
	content += fmt::format("{}={}\n", kNamespaceIdKey, record.namespaceId);
	content += fmt::format("{}={}\n", kCreationTimeKey, record.creationTime);
	content += fmt::format("{}={}\n", kStorageTypeKey, toString(StorageType::kNamespaceSlice));
	content += fmt::format("{}={}\n", kLayoutVersionKey, record.layoutVersion);
	return content;
}

NodeVersionRecord VersionRecordCodec::decodeNode(const std::string &content,
                                                 const std::string &source) {
	auto properties = parseProperties(content);
	requireStorageType(properties, StorageType::kDataNode, source);
	auto layoutVersion = requireNumber<LayoutVersion>(properties, kLayoutVersionKey, source);

	auto storageId = properties.find(kStorageIdKey);
	if (storageId == properties.end()) {
		throw InconsistentStateException(source + " has incompatible storage Id.",
		                                 KESTRELFS_ERROR_MISMATCH);
	}

	if (isPreFederationLayout(layoutVersion)) {
		return PreFederationRecord{
		    layoutVersion, storageId->second,
		    requireNumber<int32_t>(properties, kNamespaceIdKey, source),
		    requireNumber<int64_t>(properties, kCreationTimeKey, source)};
	}
	return FederationRecord{layoutVersion, storageId->second};
}

NamespaceSliceRecord VersionRecordCodec::decodeSlice(const std::string &content,
                                                     const std::string &source) {
	auto properties = parseProperties(content);
	requireStorageType(properties, StorageType::kNamespaceSlice, source);
	return NamespaceSliceRecord{
	    requireNumber<LayoutVersion>(properties, kLayoutVersionKey, source),
	    requireNumber<int32_t>(properties, kNamespaceIdKey, source),
	    requireNumber<int64_t>(properties, kCreationTimeKey, source)};
}

NodeVersionRecord VersionRecordCodec::readNode(const std::filesystem::path &file) {
	return decodeNode(readWholeFile(file), file.string());
}

NamespaceSliceRecord VersionRecordCodec::readSlice(const std::filesystem::path &file) {
	return decodeSlice(readWholeFile(file), file.string());
}

void VersionRecordCodec::write(const std::filesystem::path &file, const NodeVersionRecord &record) {
	throwOnError(writeFileSynced(file, encode(record)),
	             "can't write version file " + file.string());
}

void VersionRecordCodec::write(const std::filesystem::path &file,
                               const NamespaceSliceRecord &record) {
	throwOnError(writeFileSynced(file, encode(record)),
	             "can't write version file " + file.string());
}

void reconcileStorageId(std::string &knownStorageId, const NodeVersionRecord &record,
                        const std::string &root) {
	const auto &recorded = storageIdOf(record);
	if (!knownStorageId.empty() && !recorded.empty() && knownStorageId != recorded) {
		throw InconsistentStateException(
		    fmt::format("{} has incompatible storage Id. Recorded {}, expected {}", root,
		                recorded, knownStorageId),
		    KESTRELFS_ERROR_MISMATCH);
	}
	if (knownStorageId.empty()) {
		knownStorageId = recorded;
	}
}

}  // namespace storage
