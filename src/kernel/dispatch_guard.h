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

#include <string>
#include "world_state.h"
#include "../core/records.h"

namespace loom {

/**
 * Emission-time check for self-referential waits. A fabric request that
 * lands on the emitting instance itself, under the correlation key the
 * instance is awaiting now or is about to await, can never be answered:
 * the only writer that could resolve it is the one parked on it.
 */
class DispatchGuard {
public:
    static bool routes_to_self(const WorkflowInstance& inst, const EffectIntent& intent) {
        return intent.kind == IntentKind::Fabric &&
               intent.dest_world == intent.origin_world &&
               intent.dest_workflow == inst.workflow &&
               intent.dest_key == inst.key;
    }

    // Throws SelfCorrelationCycleError
    static void check(const WorkflowInstance& inst, const std::string& next_await, const EffectIntent& intent) {
        if (!routes_to_self(inst, intent) || intent.correlation.empty()) return;
        bool awaiting_now = inst.status == InstanceStatus::AwaitingReceipt &&
                            intent.correlation == inst.await_key;
        bool awaiting_next = !next_await.empty() && intent.correlation == next_await;
        if (awaiting_now || awaiting_next) {
            throw SelfCorrelationCycleError(inst.id(), intent.correlation);
        }
    }
};

} // namespace loom
