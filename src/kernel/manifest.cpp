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

#include "manifest.h"
#include "../core/error.h"
#include "../core/wire.h"
#include "../persistence/platform_fs.h"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace loom {

namespace {

std::string optional_string(const rapidjson::Value& obj, const char* field) {
    if (!obj.HasMember(field)) return std::string();
    if (!obj[field].IsString()) throw ConfigError(std::string("policy rule: ") + field + " is not a string");
    return obj[field].GetString();
}

PolicyDef policy_from_json(const rapidjson::Value& obj) {
    if (!obj.IsObject()) throw ConfigError("manifest \"policy\" is not an object");
    PolicyDef def;
    if (obj.HasMember("name") && obj["name"].IsString()) def.name = obj["name"].GetString();
    if (!obj.HasMember("rules")) return def;
    if (!obj["rules"].IsArray()) throw ConfigError("policy " + def.name + ": \"rules\" is not an array");
    const auto& rules = obj["rules"];
    for (rapidjson::SizeType i = 0; i < rules.Size(); i++) {
        const auto& r = rules[i];
        if (!r.IsObject()) throw ConfigError("policy rule " + std::to_string(i) + " is not an object");
        PolicyRule rule;
        rule.kind = optional_string(r, "kind");
        rule.effect = optional_string(r, "effect");
        rule.origin_workflow = optional_string(r, "origin_workflow");
        rule.dest_world = optional_string(r, "dest_world");
        std::string decision = optional_string(r, "decision");
        if (decision == "allow") {
            rule.decision = PolicyDecision::Allow;
        } else if (decision == "deny") {
            rule.decision = PolicyDecision::Deny;
        } else {
            throw ConfigError("policy rule " + std::to_string(i) + ": decision must be allow or deny");
        }
        def.rules.push_back(rule);
    }
    return def;
}

} // namespace

void Manifest::add_workflow(const WorkflowDef& def) {
    if (def.name.empty() || def.module.empty()) {
        throw ConfigError("workflow needs a name and a module");
    }
    if (def.name.find('/') != std::string::npos) {
        throw ConfigError("workflow name " + def.name + " contains '/'");
    }
    if (workflows_.count(def.name)) {
        throw ConfigError("duplicate workflow " + def.name);
    }
    for (const auto& ev : def.events) {
        auto it = routes_.find(ev);
        if (it != routes_.end()) {
            throw ConfigError("event " + ev + " routed to both " + it->second + " and " + def.name);
        }
    }
    for (const auto& ev : def.events) routes_[ev] = def.name;
    workflows_[def.name] = def;
}

void Manifest::set_policy(const PolicyDef& def) {
    if (def.name.empty()) throw ConfigError("policy needs a name");
    for (const auto& rule : def.rules) {
        if (!rule.kind.empty() && rule.kind != "effect" && rule.kind != "timer" && rule.kind != "fabric") {
            throw ConfigError("policy " + def.name + ": unknown intent kind " + rule.kind);
        }
    }
    policy_ = def;
    has_policy_ = true;
}

std::shared_ptr<const PolicyGate> Manifest::make_gate() const {
    if (!has_policy_) return std::make_shared<AllowAllPolicy>();
    return std::make_shared<RulePolicy>(policy_);
}

const WorkflowDef* Manifest::find(const std::string& workflow) const {
    auto it = workflows_.find(workflow);
    return it == workflows_.end() ? nullptr : &it->second;
}

const WorkflowDef* Manifest::route(const std::string& event_type) const {
    auto it = routes_.find(event_type);
    return it == routes_.end() ? nullptr : find(it->second);
}

std::string Manifest::encode() const {
    ByteWriter w;
    w.put_u32(static_cast<uint32_t>(workflows_.size()));
    for (const auto& kv : workflows_) {
        const WorkflowDef& def = kv.second;
        w.put_bytes(def.name);
        w.put_bytes(def.module);
        w.put_u32(static_cast<uint32_t>(def.events.size()));
        for (const auto& ev : def.events) w.put_bytes(ev);
    }
    w.put_bool(has_policy_);
    if (has_policy_) policy_.encode(w);
    return w.take();
}

Manifest Manifest::decode(const std::string& bytes) {
    ByteReader r(bytes, "manifest");
    Manifest m;
    uint32_t n = r.get_u32();
    for (uint32_t i = 0; i < n; ++i) {
        WorkflowDef def;
        def.name = r.get_bytes();
        def.module = r.get_bytes();
        uint32_t events = r.get_u32();
        for (uint32_t j = 0; j < events; ++j) def.events.push_back(r.get_bytes());
        try {
            m.add_workflow(def);
        } catch (const ConfigError& e) {
            throw CorruptError(std::string("manifest: ") + e.what());
        }
    }
    if (r.get_bool()) {
        PolicyDef policy = PolicyDef::decode(r);
        try {
            m.set_policy(policy);
        } catch (const ConfigError& e) {
            throw CorruptError(std::string("manifest: ") + e.what());
        }
    }
    r.expect_done();
    return m;
}

Manifest Manifest::from_json(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError()) {
        throw ConfigError(std::string("manifest JSON parse error at offset ") +
                          std::to_string(doc.GetErrorOffset()) + ": " +
                          rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject() || !doc.HasMember("workflows") || !doc["workflows"].IsArray()) {
        throw ConfigError("manifest JSON needs a \"workflows\" array");
    }

    Manifest m;
    const auto& list = doc["workflows"];
    for (rapidjson::SizeType i = 0; i < list.Size(); i++) {
        const auto& obj = list[i];
        if (!obj.IsObject()) throw ConfigError("workflow entry " + std::to_string(i) + " is not an object");
        WorkflowDef def;
        if (obj.HasMember("name") && obj["name"].IsString()) def.name = obj["name"].GetString();
        if (obj.HasMember("module") && obj["module"].IsString()) def.module = obj["module"].GetString();
        if (obj.HasMember("events") && obj["events"].IsArray()) {
            const auto& events = obj["events"];
            for (rapidjson::SizeType j = 0; j < events.Size(); j++) {
                if (!events[j].IsString()) throw ConfigError("workflow " + def.name + ": event is not a string");
                def.events.push_back(events[j].GetString());
            }
        }
        m.add_workflow(def);
    }
    if (doc.HasMember("policy")) m.set_policy(policy_from_json(doc["policy"]));
    return m;
}

Manifest Manifest::load_json_file(const std::string& path) {
    std::string text;
    persist::FSResult r = persist::PlatformFS::read_file(path, &text);
    if (!r.ok) throw ConfigError("cannot read manifest " + path);
    return from_json(text);
}

} // namespace loom
