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

#include "shadow_runner.h"
#include "../util/log.h"

namespace loom {

namespace {

std::string policy_bytes(const Manifest& m) {
    ByteWriter w;
    if (m.policy()) m.policy()->encode(w);
    return w.take();
}

} // namespace

ShadowRunner::ShadowRunner(Kernel& kernel) : kernel_(kernel) {}

std::vector<std::string> ShadowRunner::diff(const Manifest& from, const Manifest& to) {
    std::vector<std::string> out;
    for (const auto& kv : from.workflows()) {
        const WorkflowDef* next = to.find(kv.first);
        if (!next) {
            out.push_back("-" + kv.first);
        } else if (next->module != kv.second.module || next->events != kv.second.events) {
            out.push_back("~" + kv.first);
        }
    }
    for (const auto& kv : to.workflows()) {
        if (!from.find(kv.first)) out.push_back("+" + kv.first);
    }
    if (policy_bytes(from) != policy_bytes(to)) out.push_back("~policy");
    return out;
}

ShadowSummary ShadowRunner::run(const WorldState& live, const Hash& candidate,
                                const std::vector<IngressRecord>& seeds) {
    ShadowSummary summary;
    std::shared_ptr<const Manifest> next = kernel_.manifest(candidate);
    Manifest current;
    if (!live.manifest_hash.is_zero()) current = *kernel_.manifest(live.manifest_hash);
    summary.workflow_deltas = diff(current, *next);

    summary.blockers = live.non_terminal_instances();
    for (const auto& hex : live.inflight_intents()) summary.blockers.push_back("intent:" + hex);

    WorldState shadow = kernel_.genesis(live.world_id);
    std::vector<JournalRecord> records;
    records.push_back(JournalRecord::of(ManifestChange{candidate}));
    for (const auto& seed : seeds) records.push_back(JournalRecord::of(seed));

    for (const auto& rec : records) {
        ApplyResult res = kernel_.apply(shadow, shadow.height, rec);
        for (const auto& intent : res.emitted) {
            summary.predicted_effects.push_back(std::string(intent_kind_name(intent.kind)) + ":" + intent.effect +
                                                ":" + intent.intent_hash().short_hex());
        }
        for (const auto& r : res.rejections) {
            summary.rejections.push_back(std::string(error_kind_name(r.kind)) + " " + r.subject);
        }
    }

    debug() << "shadow of " << candidate.short_hex() << " for " << live.world_id << ": "
            << summary.predicted_effects.size() << " effect(s), " << summary.rejections.size()
            << " rejection(s), " << summary.blockers.size() << " blocker(s)";
    return summary;
}

} // namespace loom
