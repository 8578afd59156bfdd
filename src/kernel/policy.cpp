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

#include "policy.h"
#include "../core/error.h"
#include <utility>

namespace loom {

namespace {
const char* kAllowAll = "allow_all";
}

const char* policy_decision_name(PolicyDecision decision) {
    switch (decision) {
        case PolicyDecision::Allow: return "allow";
        case PolicyDecision::Deny: return "deny";
    }
    return "unknown";
}

bool PolicyRule::matches(const EffectIntent& intent) const {
    if (!kind.empty() && kind != intent_kind_name(intent.kind)) return false;
    if (!effect.empty() && effect != intent.effect) return false;
    if (!origin_workflow.empty() && origin_workflow != intent.origin_workflow) return false;
    if (!dest_world.empty() && dest_world != intent.dest_world) return false;
    return true;
}

void PolicyDef::encode(ByteWriter& w) const {
    w.put_bytes(name);
    w.put_u32(static_cast<uint32_t>(rules.size()));
    for (const auto& rule : rules) {
        w.put_bytes(rule.kind);
        w.put_bytes(rule.effect);
        w.put_bytes(rule.origin_workflow);
        w.put_bytes(rule.dest_world);
        w.put_u8(static_cast<uint8_t>(rule.decision));
    }
}

PolicyDef PolicyDef::decode(ByteReader& r) {
    PolicyDef def;
    def.name = r.get_bytes();
    uint32_t n = r.get_u32();
    for (uint32_t i = 0; i < n; ++i) {
        PolicyRule rule;
        rule.kind = r.get_bytes();
        rule.effect = r.get_bytes();
        rule.origin_workflow = r.get_bytes();
        rule.dest_world = r.get_bytes();
        uint8_t d = r.get_u8();
        if (d < 1 || d > 2) throw CorruptError("bad policy decision " + std::to_string(d));
        rule.decision = static_cast<PolicyDecision>(d);
        def.rules.push_back(rule);
    }
    return def;
}

std::string PolicyVerdict::describe() const {
    std::string out = "policy " + policy;
    out += rule < 0 ? " (no rule)" : " rule " + std::to_string(rule);
    return out + ": " + policy_decision_name(decision);
}

PolicyVerdict AllowAllPolicy::decide(const EffectIntent&) const {
    PolicyVerdict v;
    v.policy = kAllowAll;
    return v;
}

RulePolicy::RulePolicy(PolicyDef def) : def_(std::move(def)) {}

PolicyVerdict RulePolicy::decide(const EffectIntent& intent) const {
    PolicyVerdict v;
    v.policy = def_.name;
    for (size_t i = 0; i < def_.rules.size(); ++i) {
        if (def_.rules[i].matches(intent)) {
            v.rule = static_cast<int>(i);
            v.decision = def_.rules[i].decision;
            return v;
        }
    }
    v.decision = PolicyDecision::Deny;
    return v;
}

} // namespace loom
