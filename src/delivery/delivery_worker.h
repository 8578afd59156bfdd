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
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include "delivery_queue.h"
#include "executors.h"

namespace loom {

struct DeliveryStats {
    uint64_t claimed = 0;
    uint64_t delivered = 0;
    uint64_t already_delivered = 0;
    uint64_t claims_lost = 0;
    uint64_t reaped = 0;
};

/**
 * Claim/execute/ack loop for one pipeline. run_once() is the whole
 * protocol for one batch; start() runs it on a background thread until
 * stop().
 */
class DeliveryWorker {
public:
    DeliveryWorker(std::string owner, DeliveryQueue& queue, Executor& executor, uint64_t claim_ttl_ns,
                   size_t batch, uint64_t poll_interval_ms);
    ~DeliveryWorker();

    DeliveryWorker(const DeliveryWorker&) = delete;
    DeliveryWorker& operator=(const DeliveryWorker&) = delete;

    // Reap, claim a batch, execute, ack. Returns items claimed.
    size_t run_once();

    void start();
    void stop();
    bool running() const { return running_.load(); }

    DeliveryStats stats() const;

private:
    void loop();

    std::string owner_;
    DeliveryQueue& queue_;
    Executor& executor_;
    uint64_t claim_ttl_ns_;
    size_t batch_;
    uint64_t poll_interval_ms_;

    std::atomic<bool> running_{false};
    std::thread th_;
    std::mutex mu_;
    std::condition_variable cv_;

    mutable std::mutex stats_mu_;
    DeliveryStats stats_;
};

} // namespace loom
