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
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>
#include "../core/hash.h"
#include "../core/records.h"

namespace loom {

enum class EventSource : uint8_t {
    Event = 1,
    Fabric = 2,
    Receipt = 3
};

// What a module sees for one fold step
struct WorkflowEvent {
    EventSource source = EventSource::Event;
    std::string type;             // event type, fabric effect name or receipt effect name
    std::string payload;
    std::string correlation;
    ReceiptStatus status = ReceiptStatus::Ok;   // receipts only
    IntentKind intent_kind = IntentKind::Effect; // receipts only
    std::string source_world;     // fabric only
    Hash intent_hash;             // receipts only
    uint64_t logical_now_ns = 0;
};

struct InvokeContext {
    std::string world;
    std::string workflow;
    std::string key;
    uint64_t height = 0;
    uint64_t logical_now_ns = 0;
    std::string await_key;        // empty unless the instance was awaiting
};

struct EffectRequest {
    IntentKind kind = IntentKind::Effect;
    std::string effect;
    std::string params;
    std::string correlation;
    uint64_t delay_ns = 0;          // timers
    std::string dest_world;         // fabric; empty = own world
    std::string dest_workflow;
    std::string dest_key;
    std::string message_id;         // fabric; empty = intent hash
    std::string idempotency_key;    // empty = per-instance emission counter
};

enum class Directive : uint8_t {
    Continue = 1,
    Await = 2,
    Complete = 3
};

struct ModuleOutput {
    std::string state;
    std::vector<EffectRequest> effects;
    Directive directive = Directive::Continue;
    std::string await_key;   // Directive::Await only
};

/**
 * Executes workflow logic. Implementations must be deterministic: the
 * same (module, state, event, context) always yields the same output.
 * Throwing signals a module failure; the kernel records it in the instance.
 */
class ModuleHost {
public:
    virtual ~ModuleHost() = default;
    virtual ModuleOutput invoke(const std::string& module, const std::string& state,
                                const WorkflowEvent& event, const InvokeContext& ctx) = 0;
};

// Host for modules written as C++ callables
class NativeModuleHost : public ModuleHost {
public:
    using ModuleFn = std::function<ModuleOutput(const std::string& state, const WorkflowEvent& event,
                                                const InvokeContext& ctx)>;

    void register_module(const std::string& name, ModuleFn fn);
    bool has_module(const std::string& name) const;

    ModuleOutput invoke(const std::string& module, const std::string& state,
                        const WorkflowEvent& event, const InvokeContext& ctx) override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, ModuleFn> modules_;
};

} // namespace loom
