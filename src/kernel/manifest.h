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

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "policy.h"
#include "../core/hash.h"

namespace loom {

struct WorkflowDef {
    std::string name;
    std::string module;               // module host name
    std::vector<std::string> events;  // event types routed to this workflow
};

/**
 * Set of workflow definitions plus the routing table from event type to
 * workflow, and optionally the policy every emitted intent must pass.
 * Every event type routes to at most one workflow. Stored in the object
 * store by its canonical encoding; the hash of that encoding is the
 * world's manifest_hash.
 */
class Manifest {
public:
    // Throws ConfigError on a duplicate workflow name or event route
    void add_workflow(const WorkflowDef& def);

    const WorkflowDef* find(const std::string& workflow) const;
    const WorkflowDef* route(const std::string& event_type) const;

    // Throws ConfigError for an unnamed policy or an unknown intent kind
    void set_policy(const PolicyDef& def);
    const PolicyDef* policy() const { return has_policy_ ? &policy_ : nullptr; }

    // AllowAllPolicy when the manifest carries no policy
    std::shared_ptr<const PolicyGate> make_gate() const;

    const std::map<std::string, WorkflowDef>& workflows() const { return workflows_; }
    bool empty() const { return workflows_.empty(); }

    std::string encode() const;
    static Manifest decode(const std::string& bytes);
    Hash hash() const { return sha256(encode()); }

    /**
     * {"workflows": [{"name": "...", "module": "...", "events": ["..."]}],
     *  "policy": {"name": "...", "rules": [{"kind": "...", "effect": "...",
     *             "origin_workflow": "...", "dest_world": "...",
     *             "decision": "allow" | "deny"}]}}
     * policy and every rule matcher are optional. Throws ConfigError on
     * malformed input.
     */
    static Manifest from_json(const std::string& json);
    static Manifest load_json_file(const std::string& path);

private:
    std::map<std::string, WorkflowDef> workflows_;
    std::map<std::string, std::string> routes_;  // event type -> workflow
    PolicyDef policy_;
    bool has_policy_ = false;
};

} // namespace loom
