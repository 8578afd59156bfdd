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

#include "runtime_config.h"
#include "../core/error.h"
#include "../persistence/platform_fs.h"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <cstdlib>
#include <unistd.h>

namespace loom {

namespace {

uint64_t env_u64(const char* name, uint64_t fallback) {
    const char* env = std::getenv(name);
    if (!env || !*env) return fallback;
    char* end = nullptr;
    unsigned long long v = std::strtoull(env, &end, 10);
    if (end == env || *end != '\0') throw ConfigError(std::string(name) + " is not a number: " + env);
    return static_cast<uint64_t>(v);
}

template <typename T>
void read_uint(const rapidjson::Value& obj, const char* name, T* out) {
    if (!obj.HasMember(name)) return;
    if (!obj[name].IsUint64()) throw ConfigError(std::string("config field ") + name + " must be an unsigned integer");
    *out = static_cast<T>(obj[name].GetUint64());
}

void read_string(const rapidjson::Value& obj, const char* name, std::string* out) {
    if (!obj.HasMember(name)) return;
    if (!obj[name].IsString()) throw ConfigError(std::string("config field ") + name + " must be a string");
    *out = obj[name].GetString();
}

} // namespace

RuntimeConfig RuntimeConfig::defaults() {
    RuntimeConfig cfg;
    cfg.storage = persist::StorageConfig::defaults();

    if (const char* env = std::getenv("LOOM_WORKER_ID")) {
        cfg.worker_id = env;
    }
    if (cfg.worker_id.empty()) {
        char host[64] = {0};
        if (gethostname(host, sizeof(host) - 1) != 0) host[0] = '\0';
        cfg.worker_id = std::string(host[0] ? host : "worker") + "-" + std::to_string(getpid());
    }
    cfg.lease_ttl_ms = env_u64("LOOM_LEASE_TTL_MS", cfg.lease_ttl_ms);
    cfg.claim_ttl_ms = env_u64("LOOM_CLAIM_TTL_MS", cfg.claim_ttl_ms);
    cfg.step_budget = env_u64("LOOM_STEP_BUDGET", cfg.step_budget);
    cfg.inbox_batch = env_u64("LOOM_INBOX_BATCH", cfg.inbox_batch);
    cfg.snapshot_every = env_u64("LOOM_SNAPSHOT_EVERY", cfg.snapshot_every);
    cfg.delivery_batch = env_u64("LOOM_DELIVERY_BATCH", cfg.delivery_batch);
    cfg.poll_interval_ms = env_u64("LOOM_POLL_INTERVAL_MS", cfg.poll_interval_ms);
    return cfg;
}

void RuntimeConfig::apply_json(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError()) {
        throw ConfigError(std::string("config JSON parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
                          ": " + rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) throw ConfigError("config JSON must be an object");

    read_string(doc, "worker_id", &worker_id);
    read_uint(doc, "lease_ttl_ms", &lease_ttl_ms);
    read_uint(doc, "claim_ttl_ms", &claim_ttl_ms);
    read_uint(doc, "step_budget", &step_budget);
    read_uint(doc, "inbox_batch", &inbox_batch);
    read_uint(doc, "snapshot_every", &snapshot_every);
    read_uint(doc, "delivery_batch", &delivery_batch);
    read_uint(doc, "max_claims", &max_claims);
    read_uint(doc, "adapter_attempts", &adapter_attempts);
    read_uint(doc, "adapter_backoff_ms", &adapter_backoff_ms);
    read_uint(doc, "poll_interval_ms", &poll_interval_ms);

    if (doc.HasMember("storage")) {
        const auto& st = doc["storage"];
        if (!st.IsObject()) throw ConfigError("config field storage must be an object");
        read_string(st, "data_dir", &storage.data_dir);
        read_string(st, "durability", &storage.durability);
        read_uint(st, "checkpoint_every_commits", &storage.checkpoint_every_commits);
        read_uint(st, "checkpoint_keep_count", &storage.checkpoint_keep_count);
        read_uint(st, "log_rotate_bytes", &storage.log_rotate_bytes);
    }
}

RuntimeConfig RuntimeConfig::from_json(const std::string& path) {
    std::string text;
    persist::FSResult r = persist::PlatformFS::read_file(path, &text);
    if (!r.ok) throw ConfigError("cannot read config " + path);
    RuntimeConfig cfg = defaults();
    cfg.apply_json(text);
    return cfg;
}

std::string RuntimeConfig::validate() const {
    if (worker_id.empty()) return "worker_id is empty";
    if (lease_ttl_ms == 0) return "lease_ttl_ms must be positive";
    if (claim_ttl_ms == 0) return "claim_ttl_ms must be positive";
    if (step_budget == 0) return "step_budget must be positive";
    if (inbox_batch == 0) return "inbox_batch must be positive";
    if (delivery_batch == 0) return "delivery_batch must be positive";
    if (adapter_attempts == 0) return "adapter_attempts must be positive";
    if (!storage.validate()) return "storage config is invalid (durability " + storage.durability + ")";
    return std::string();
}

} // namespace loom
