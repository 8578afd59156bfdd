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

#include "delivery_worker.h"
#include "../util/log.h"
#include <chrono>

namespace loom {

DeliveryWorker::DeliveryWorker(std::string owner, DeliveryQueue& queue, Executor& executor, uint64_t claim_ttl_ns,
                               size_t batch, uint64_t poll_interval_ms)
    : owner_(std::move(owner)), queue_(queue), executor_(executor), claim_ttl_ns_(claim_ttl_ns), batch_(batch),
      poll_interval_ms_(poll_interval_ms) {}

DeliveryWorker::~DeliveryWorker() {
    stop();
}

size_t DeliveryWorker::run_once() {
    size_t reaped = queue_.reap();
    std::vector<Claim> claims = queue_.claim(owner_, batch_, claim_ttl_ns_);

    DeliveryStats local;
    local.reaped = reaped;
    local.claimed = claims.size();
    for (const auto& c : claims) {
        std::vector<InboxDelivery> deliveries = executor_.execute(c.item);
        AckResult r = queue_.ack(c, deliveries);
        switch (r.status) {
            case AckStatus::Delivered: ++local.delivered; break;
            case AckStatus::AlreadyDelivered: ++local.already_delivered; break;
            case AckStatus::ClaimLost: ++local.claims_lost; break;
        }
    }

    std::lock_guard<std::mutex> lock(stats_mu_);
    stats_.claimed += local.claimed;
    stats_.delivered += local.delivered;
    stats_.already_delivered += local.already_delivered;
    stats_.claims_lost += local.claims_lost;
    stats_.reaped += local.reaped;
    return claims.size();
}

DeliveryStats DeliveryWorker::stats() const {
    std::lock_guard<std::mutex> lock(stats_mu_);
    return stats_;
}

void DeliveryWorker::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    th_ = std::thread([this] { loop(); });
}

void DeliveryWorker::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(mu_);
    }
    cv_.notify_all();
    if (th_.joinable()) th_.join();
}

void DeliveryWorker::loop() {
    Logger::get().setThreadName(owner_ + "-" + pipeline_scope(queue_.pipeline()));
    while (running_.load()) {
        size_t claimed = 0;
        try {
            claimed = run_once();
        } catch (const std::exception& e) {
            error() << "delivery " << pipeline_scope(queue_.pipeline()) << " cycle failed: " << e.what();
        }
        if (claimed) continue;
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms_), [this] { return !running_.load(); });
    }
    Logger::get().flush();
}

} // namespace loom
