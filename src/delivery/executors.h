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

#include <functional>
#include <string>
#include <vector>
#include "adapter.h"
#include "delivery_queue.h"
#include "inbox.h"
#include "../core/clock.h"

namespace loom {

/**
 * Execute step of one pipeline. Turns a claimed item into the inbox
 * deliveries its ack will enqueue. Executors never touch the store.
 */
class Executor {
public:
    virtual ~Executor() = default;
    virtual Pipeline pipeline() const = 0;
    virtual std::vector<InboxDelivery> execute(const DispatchItem& item) = 0;
};

// Receipt delivery back to the emitting world
InboxDelivery receipt_delivery(const EffectIntent& intent, ReceiptStatus status, const std::string& adapter_id,
                               const std::string& payload, uint64_t logical_now_ns = 0);

class EffectExecutor : public Executor {
public:
    using Sleeper = std::function<void(uint64_t ms)>;

    // max_claims bounds redelivery across crashes; past it the intent fails with an Error receipt
    EffectExecutor(const AdapterRegistry& registry, RetryPolicy policy, uint32_t max_claims,
                   Sleeper sleeper = Sleeper());

    Pipeline pipeline() const override { return Pipeline::Effects; }
    std::vector<InboxDelivery> execute(const DispatchItem& item) override;

private:
    const AdapterRegistry& registry_;
    RetryPolicy policy_;
    uint32_t max_claims_;
    Sleeper sleeper_;
};

// Claims are due-only, so firing is just the Ok receipt
class TimerExecutor : public Executor {
public:
    Pipeline pipeline() const override { return Pipeline::Timers; }
    std::vector<InboxDelivery> execute(const DispatchItem& item) override;
};

/**
 * Cross-world message: one Fabric ingress for the destination inbox,
 * deduplicated by message id, plus an Ok receipt for the sender. An
 * unknown destination yields an Error receipt and no message.
 */
class FabricExecutor : public Executor {
public:
    using WorldExists = std::function<bool(const std::string& world)>;

    explicit FabricExecutor(WorldExists exists = WorldExists());

    Pipeline pipeline() const override { return Pipeline::Fabric; }
    std::vector<InboxDelivery> execute(const DispatchItem& item) override;

private:
    WorldExists exists_;
};

} // namespace loom
