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
#include "../core/clock.h"
#include "../delivery/delivery_queue.h"
#include "../delivery/inbox.h"
#include "../journal/journal.h"
#include "../journal/replay.h"
#include "../kernel/kernel.h"
#include "../lease/lease_manager.h"
#include "../persistence/kv_store.h"
#include "../persistence/object_store.h"
#include "../snapshot/snapshot_manager.h"

namespace loom {

/**
 * The per-node component graph over one shared store. Workers, delivery
 * loops and the catalog all borrow from here; nothing in it owns a world.
 */
class WorldServices {
public:
    WorldServices(persist::KvStore& kv_store, persist::ObjectStore& object_store, ModuleHost& host,
                  const Clock& node_clock, uint64_t lease_ttl_ns)
        : kv(kv_store),
          objects(object_store),
          clock(node_clock),
          leases(kv_store, node_clock, lease_ttl_ns),
          journal(kv_store, leases),
          snapshots(kv_store, object_store, journal, leases, node_clock),
          kernel(object_store, host),
          replayer(journal, snapshots, kernel),
          inbox(kv_store),
          effects(Pipeline::Effects, kv_store, leases, inbox, node_clock),
          timers(Pipeline::Timers, kv_store, leases, inbox, node_clock),
          fabric(Pipeline::Fabric, kv_store, leases, inbox, node_clock) {}

    WorldServices(const WorldServices&) = delete;
    WorldServices& operator=(const WorldServices&) = delete;

    DeliveryQueue& queue(Pipeline p) {
        switch (p) {
            case Pipeline::Timers: return timers;
            case Pipeline::Fabric: return fabric;
            case Pipeline::Effects: break;
        }
        return effects;
    }

    persist::KvStore& kv;
    persist::ObjectStore& objects;
    const Clock& clock;
    LeaseManager leases;
    Journal journal;
    SnapshotManager snapshots;
    Kernel kernel;
    Replayer replayer;
    Inbox inbox;
    DeliveryQueue effects;
    DeliveryQueue timers;
    DeliveryQueue fabric;
};

} // namespace loom
