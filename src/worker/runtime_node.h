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

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "runtime_config.h"
#include "world_catalog.h"
#include "world_services.h"
#include "world_worker.h"
#include "../delivery/adapter.h"
#include "../delivery/delivery_worker.h"
#include "../delivery/executors.h"

namespace loom {

/**
 * One process worth of runtime: a set of hosted worlds stepped on a
 * background thread, plus a delivery worker per pipeline. run_once()
 * performs a single deterministic round of everything for tests and
 * tools that want to drive the loop themselves.
 */
class RuntimeNode {
public:
    RuntimeNode(const RuntimeConfig& config, persist::KvStore& kv, persist::ObjectStore& objects,
                ModuleHost& host, const AdapterRegistry& adapters, const Clock& clock);
    ~RuntimeNode();

    RuntimeNode(const RuntimeNode&) = delete;
    RuntimeNode& operator=(const RuntimeNode&) = delete;

    void host_world(const std::string& world);
    // Releases the lease if held
    void drop_world(const std::string& world);
    std::vector<std::string> hosted_worlds() const;

    /**
     * Steps every hosted world once, then runs one delivery cycle per
     * pipeline. Returns true if anything moved. ReplayMismatchError from a
     * world propagates.
     */
    bool run_once();

    // Repeats run_once() until nothing moves or max_rounds is reached
    size_t run_until_idle(size_t max_rounds = 1000);

    void start();
    void stop();
    bool running() const { return running_.load(); }

    WorkerState world_state(const std::string& world) const;
    std::vector<std::string> halted_worlds() const;
    // Resident state of a hosted world; throws NotFoundError if not resident
    WorldState resident_state(const std::string& world) const;

    WorldServices& services() { return services_; }
    WorldCatalog& catalog() { return catalog_; }
    DeliveryWorker& delivery(Pipeline p);
    const RuntimeConfig& config() const { return config_; }

private:
    bool step_worlds(bool rethrow);
    void world_loop();

    RuntimeConfig config_;
    WorldServices services_;
    WorldCatalog catalog_;

    EffectExecutor effect_exec_;
    TimerExecutor timer_exec_;
    FabricExecutor fabric_exec_;
    std::unique_ptr<DeliveryWorker> effects_;
    std::unique_ptr<DeliveryWorker> timers_;
    std::unique_ptr<DeliveryWorker> fabric_;

    mutable std::mutex worlds_mu_;
    std::map<std::string, std::unique_ptr<WorldWorker>> worlds_;
    std::set<std::string> halted_;

    std::atomic<bool> running_{false};
    std::thread th_;
    std::mutex cv_mu_;
    std::condition_variable cv_;
};

} // namespace loom
