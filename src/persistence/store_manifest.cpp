/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "store_manifest.h"
#include "config.h"
#include "platform_fs.h"
#include "../util/log.h"
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/error/en.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace loom {
namespace persist {

StoreManifest::StoreManifest(const std::string& data_dir)
    : data_dir_(data_dir), created_unix_(static_cast<int64_t>(std::time(nullptr))) {}

std::string StoreManifest::manifest_path() const {
    return (std::filesystem::path(data_dir_) / files::kManifestFile).string();
}

bool StoreManifest::load() {
    std::string json_str;
    FSResult r = PlatformFS::read_file(manifest_path(), &json_str);
    if (!r.ok || json_str.empty()) {
        return false;
    }
    return from_json(json_str);
}

bool StoreManifest::store() {
    FSResult dir = PlatformFS::ensure_directory(data_dir_);
    if (!dir.ok) {
        error() << "StoreManifest: cannot create " << data_dir_ << ": " << errnoWithDescription(dir.err);
        return false;
    }
    FSResult r = PlatformFS::write_file_durable(manifest_path(), to_json());
    if (!r.ok) {
        error() << "StoreManifest: write failed: " << errnoWithDescription(r.err);
        return false;
    }
    return true;
}

void StoreManifest::prune_logs_before(uint64_t checkpoint_commit) {
    // A log is obsolete once the next log starts at or below the checkpoint
    std::vector<LogInfo> kept;
    for (size_t i = 0; i < logs_.size(); ++i) {
        bool has_successor = i + 1 < logs_.size();
        if (has_successor && logs_[i + 1].start_commit <= checkpoint_commit + 1) {
            continue;
        }
        kept.push_back(logs_[i]);
    }
    logs_.swap(kept);
}

std::string StoreManifest::to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();

    writer.Key("version");
    writer.Uint(version_);

    writer.Key("created_unix");
    writer.Int64(created_unix_);

    writer.Key("checkpoint");
    writer.StartObject();
    if (!checkpoint_.path.empty()) {
        writer.Key("path");
        writer.String(checkpoint_.path.c_str());
        writer.Key("commit_seq");
        writer.Uint64(checkpoint_.commit_seq);
        writer.Key("entries");
        writer.Uint64(checkpoint_.entries);
        writer.Key("crc32c");
        char hex_buf[16];
        snprintf(hex_buf, sizeof(hex_buf), "0x%08x", checkpoint_.crc32c);
        writer.String(hex_buf);
    }
    writer.EndObject();

    writer.Key("logs");
    writer.StartArray();
    for (const auto& log : logs_) {
        writer.StartObject();
        writer.Key("path");
        writer.String(log.path.c_str());
        writer.Key("sequence");
        writer.Uint64(log.sequence);
        writer.Key("start_commit");
        writer.Uint64(log.start_commit);
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    return buffer.GetString();
}

bool StoreManifest::from_json(const std::string& json_str) {
    rapidjson::Document doc;
    doc.Parse(json_str.c_str());

    if (doc.HasParseError()) {
        error() << "JSON parse error at offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        return false;
    }
    if (!doc.IsObject()) {
        return false;
    }

    if (doc.HasMember("version") && doc["version"].IsUint()) {
        version_ = doc["version"].GetUint();
    }
    if (doc.HasMember("created_unix") && doc["created_unix"].IsInt64()) {
        created_unix_ = doc["created_unix"].GetInt64();
    }

    checkpoint_ = CheckpointInfo();
    if (doc.HasMember("checkpoint") && doc["checkpoint"].IsObject()) {
        const auto& ckpt = doc["checkpoint"];
        if (ckpt.HasMember("path") && ckpt["path"].IsString()) {
            checkpoint_.path = ckpt["path"].GetString();
        }
        if (ckpt.HasMember("commit_seq") && ckpt["commit_seq"].IsUint64()) {
            checkpoint_.commit_seq = ckpt["commit_seq"].GetUint64();
        }
        if (ckpt.HasMember("entries") && ckpt["entries"].IsUint64()) {
            checkpoint_.entries = ckpt["entries"].GetUint64();
        }
        if (ckpt.HasMember("crc32c") && ckpt["crc32c"].IsString()) {
            checkpoint_.crc32c = static_cast<uint32_t>(std::strtoul(ckpt["crc32c"].GetString(), nullptr, 16));
        }
    }

    logs_.clear();
    if (doc.HasMember("logs") && doc["logs"].IsArray()) {
        const auto& logs = doc["logs"];
        for (rapidjson::SizeType i = 0; i < logs.Size(); i++) {
            const auto& obj = logs[i];
            if (!obj.IsObject()) continue;
            LogInfo info;
            if (obj.HasMember("path") && obj["path"].IsString()) {
                info.path = obj["path"].GetString();
            }
            if (obj.HasMember("sequence") && obj["sequence"].IsUint64()) {
                info.sequence = obj["sequence"].GetUint64();
            }
            if (obj.HasMember("start_commit") && obj["start_commit"].IsUint64()) {
                info.start_commit = obj["start_commit"].GetUint64();
            }
            if (!info.path.empty()) logs_.push_back(info);
        }
    }
    std::sort(logs_.begin(), logs_.end(),
              [](const LogInfo& a, const LogInfo& b) { return a.sequence < b.sequence; });

    return true;
}

} // namespace persist
} // namespace loom
