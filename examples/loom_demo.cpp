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

/*
 * Runs a small "shop" world end to end: an order fans out into parallel
 * charges, a delivery worker executes them against a local adapter, and
 * the receipts fold back into the world until the order completes.
 *
 *   loom_demo [config.json] [manifest.json]
 *
 * With LOOM_DATA_DIR (or "storage.data_dir" in the config) set, the store
 * is durable and a second run resumes the same world from disk.
 */

#include <iostream>
#include <memory>
#include <string>
#include "../src/core/clock.h"
#include "../src/core/error.h"
#include "../src/delivery/adapter.h"
#include "../src/kernel/manifest.h"
#include "../src/kernel/module_host.h"
#include "../src/persistence/durable_kv_store.h"
#include "../src/persistence/memory_kv_store.h"
#include "../src/persistence/object_store.h"
#include "../src/util/log.h"
#include "../src/util/log_runtime.h"
#include "../src/worker/runtime_config.h"
#include "../src/worker/runtime_node.h"

using namespace loom;
using namespace std;

namespace {

// "order.placed" with payload N emits N charges joined on one correlation
ModuleOutput order_module(const string& state, const WorkflowEvent& ev, const InvokeContext&) {
    ModuleOutput out;
    if (ev.source == EventSource::Event) {
        int n = ev.payload.empty() ? 1 : stoi(ev.payload);
        for (int i = 0; i < n; ++i) {
            EffectRequest req;
            req.effect = "charge";
            req.params = "line-" + to_string(i);
            req.correlation = "payment";
            out.effects.push_back(req);
        }
        out.state = to_string(n) + ":0";
        out.directive = Directive::Await;
        out.await_key = "payment";
        return out;
    }
    size_t colon = state.find(':');
    int expected = stoi(state.substr(0, colon));
    int received = stoi(state.substr(colon + 1)) + 1;
    if (ev.status != ReceiptStatus::Ok) {
        out.state = "failed:" + ev.payload;
        out.directive = Directive::Complete;
        return out;
    }
    out.state = to_string(expected) + ":" + to_string(received);
    out.directive = received >= expected ? Directive::Complete : Directive::Continue;
    return out;
}

ModuleOutput audit_module(const string& state, const WorkflowEvent& ev, const InvokeContext&) {
    ModuleOutput out;
    out.state = state.empty() ? ev.payload : state + "," + ev.payload;
    out.directive = Directive::Continue;
    return out;
}

class LocalPayments : public Adapter {
public:
    string id() const override { return "local-payments"; }
    AdapterResult execute(const EffectIntent& intent) override {
        AdapterResult r;
        r.payload = "charged:" + intent.params;
        return r;
    }
};

Manifest default_manifest() {
    Manifest m;
    m.add_workflow(WorkflowDef{"orders", "order", {"order.placed"}});
    m.add_workflow(WorkflowDef{"audit", "audit", {"audit.note"}});
    return m;
}

void print_state(const WorldState& ws) {
    cout << "world " << ws.world_id << " @ height " << ws.height
         << " (state " << ws.state_hash().short_hex() << ")\n";
    for (const auto& entry : ws.instances) {
        const WorkflowInstance& inst = entry.second;
        cout << "  " << entry.first << " [" << instance_status_name(inst.status) << "] "
             << inst.state << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    LogRuntimeGuard logging(LogRuntime::Config::from_env());
    Logger::get().setThreadName("demo");

    try {
        RuntimeConfig cfg = argc > 1 ? RuntimeConfig::from_json(argv[1]) : RuntimeConfig::defaults();
        if (cfg.worker_id.empty()) cfg.worker_id = "demo-node";
        Manifest manifest = argc > 2 ? Manifest::load_json_file(argv[2]) : default_manifest();

        unique_ptr<persist::MemoryKvStore> kv;
        unique_ptr<persist::ObjectStore> objects;
        if (cfg.storage.data_dir.empty()) {
            kv = make_unique<persist::MemoryKvStore>();
            objects = make_unique<persist::MemoryObjectStore>();
        } else {
            auto durable = make_unique<persist::DurableKvStore>(cfg.storage.data_dir + "/kv", cfg.storage);
            durable->open();
            kv = std::move(durable);
            objects = make_unique<persist::FsObjectStore>(cfg.storage.data_dir + "/objects");
        }

        NativeModuleHost host;
        host.register_module("order", order_module);
        host.register_module("audit", audit_module);
        AdapterRegistry adapters;
        adapters.register_adapter("charge", make_shared<LocalPayments>());
        SystemClock clock;

        RuntimeNode node(cfg, *kv, *objects, host, adapters, clock);
        const string world = "shop";
        if (!node.catalog().exists(world)) {
            node.catalog().create_world(world, "demo", manifest);
            info() << "created world " << world;
        }
        node.host_world(world);

        node.catalog().submit_event(world, "order.placed", "order-1", "3");
        node.catalog().submit_event(world, "audit.note", "log", "order-1 placed");
        size_t rounds = node.run_until_idle();
        info() << "idle after " << rounds << " rounds";

        print_state(node.resident_state(world));
        if (!node.halted_worlds().empty()) {
            error() << "halted worlds: " << node.halted_worlds().size();
            return 1;
        }
        node.drop_world(world);
        kv->sync();
    } catch (const std::exception& e) {
        error() << "demo failed: " << e.what();
        return 1;
    }
    return 0;
}
