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

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../core/records.h"
#include "../core/wire.h"

namespace loom {

enum class PolicyDecision : uint8_t {
    Allow = 1,
    Deny = 2
};

const char* policy_decision_name(PolicyDecision decision);

/**
 * One ordered rule. Every non-empty matcher must equal the intent's
 * field; an empty matcher matches anything.
 */
struct PolicyRule {
    std::string kind;             // "effect", "timer", "fabric"
    std::string effect;
    std::string origin_workflow;
    std::string dest_world;       // fabric only
    PolicyDecision decision = PolicyDecision::Allow;

    bool matches(const EffectIntent& intent) const;
};

// Named rule list carried by a manifest
struct PolicyDef {
    std::string name;
    std::vector<PolicyRule> rules;

    void encode(ByteWriter& w) const;
    static PolicyDef decode(ByteReader& r);
};

struct PolicyVerdict {
    std::string policy;
    int rule = -1;                // -1: no rule matched
    PolicyDecision decision = PolicyDecision::Allow;

    bool allowed() const { return decision == PolicyDecision::Allow; }
    std::string describe() const;
};

/**
 * Decides whether the fold may emit an intent. Implementations must be
 * pure functions of the intent and their own immutable configuration,
 * since replay asks the same question again.
 */
class PolicyGate {
public:
    virtual ~PolicyGate() = default;
    virtual PolicyVerdict decide(const EffectIntent& intent) const = 0;
};

class AllowAllPolicy final : public PolicyGate {
public:
    PolicyVerdict decide(const EffectIntent& intent) const override;
};

// First matching rule wins; no match denies
class RulePolicy final : public PolicyGate {
public:
    explicit RulePolicy(PolicyDef def);

    PolicyVerdict decide(const EffectIntent& intent) const override;

private:
    PolicyDef def_;
};

} // namespace loom
