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

#include "runtime_node.h"
#include "../core/error.h"
#include "../util/log.h"
#include <chrono>
#include <memory>

namespace loom {

namespace {

RetryPolicy retry_policy(const RuntimeConfig& cfg) {
    RetryPolicy p;
    p.max_attempts = cfg.adapter_attempts;
    p.initial_backoff_ms = cfg.adapter_backoff_ms;
    return p;
}

} // namespace

RuntimeNode::RuntimeNode(const RuntimeConfig& config, persist::KvStore& kv, persist::ObjectStore& objects,
                         ModuleHost& host, const AdapterRegistry& adapters, const Clock& clock)
    : config_(config),
      services_(kv, objects, host, clock, to_ns(std::chrono::milliseconds(config.lease_ttl_ms))),
      catalog_(services_),
      effect_exec_(adapters, retry_policy(config), config.max_claims),
      fabric_exec_([this](const std::string& world) { return catalog_.exists(world); }) {
    std::string problem = config_.validate();
    if (!problem.empty()) throw ConfigError(problem);

    const uint64_t claim_ttl = to_ns(std::chrono::milliseconds(config_.claim_ttl_ms));
    effects_ = std::make_unique<DeliveryWorker>(config_.worker_id, services_.effects, effect_exec_, claim_ttl,
                                                config_.delivery_batch, config_.poll_interval_ms);
    timers_ = std::make_unique<DeliveryWorker>(config_.worker_id, services_.timers, timer_exec_, claim_ttl,
                                               config_.delivery_batch, config_.poll_interval_ms);
    fabric_ = std::make_unique<DeliveryWorker>(config_.worker_id, services_.fabric, fabric_exec_, claim_ttl,
                                               config_.delivery_batch, config_.poll_interval_ms);
}

RuntimeNode::~RuntimeNode() {
    stop();
}

DeliveryWorker& RuntimeNode::delivery(Pipeline p) {
    switch (p) {
        case Pipeline::Timers: return *timers_;
        case Pipeline::Fabric: return *fabric_;
        case Pipeline::Effects: break;
    }
    return *effects_;
}

void RuntimeNode::host_world(const std::string& world) {
    std::lock_guard<std::mutex> lock(worlds_mu_);
    if (worlds_.count(world)) return;
    worlds_[world] = std::make_unique<WorldWorker>(world, services_, WorkerOptions::from(config_));
    halted_.erase(world);
    info() << config_.worker_id << " hosting " << world;
}

void RuntimeNode::drop_world(const std::string& world) {
    std::lock_guard<std::mutex> lock(worlds_mu_);
    auto it = worlds_.find(world);
    if (it == worlds_.end()) return;
    it->second->release();
    worlds_.erase(it);
    halted_.erase(world);
}

std::vector<std::string> RuntimeNode::hosted_worlds() const {
    std::lock_guard<std::mutex> lock(worlds_mu_);
    std::vector<std::string> out;
    for (const auto& kv : worlds_) out.push_back(kv.first);
    return out;
}

WorkerState RuntimeNode::world_state(const std::string& world) const {
    std::lock_guard<std::mutex> lock(worlds_mu_);
    auto it = worlds_.find(world);
    if (it == worlds_.end()) throw NotFoundError("world " + world + " is not hosted here");
    return it->second->state();
}

std::vector<std::string> RuntimeNode::halted_worlds() const {
    std::lock_guard<std::mutex> lock(worlds_mu_);
    return std::vector<std::string>(halted_.begin(), halted_.end());
}

WorldState RuntimeNode::resident_state(const std::string& world) const {
    std::lock_guard<std::mutex> lock(worlds_mu_);
    auto it = worlds_.find(world);
    if (it == worlds_.end() || !it->second->resident()) {
        throw NotFoundError("world " + world + " is not resident");
    }
    return it->second->world_state();
}

bool RuntimeNode::step_worlds(bool rethrow) {
    bool moved = false;
    std::lock_guard<std::mutex> lock(worlds_mu_);
    for (auto& kv : worlds_) {
        WorldWorker& w = *kv.second;
        if (w.halted()) continue;
        if (w.state() == WorkerState::Fenced) {
            // Lease moved on; try to win it back with a fresh worker next round
            kv.second = std::make_unique<WorldWorker>(kv.first, services_, WorkerOptions::from(config_));
            moved = true;
            continue;
        }
        try {
            StepReport r = w.step();
            moved = moved || r.drained || r.folded || r.published || r.snapshotted || r.promoted;
        } catch (const ReplayMismatchError&) {
            halted_.insert(kv.first);
            if (rethrow) throw;
        } catch (const std::exception&) {
            // The worker logged it and will rebuild from the journal next round
            if (rethrow) throw;
        }
    }
    return moved;
}

bool RuntimeNode::run_once() {
    bool moved = step_worlds(true);
    moved = effects_->run_once() > 0 || moved;
    moved = timers_->run_once() > 0 || moved;
    moved = fabric_->run_once() > 0 || moved;
    return moved;
}

size_t RuntimeNode::run_until_idle(size_t max_rounds) {
    size_t rounds = 0;
    while (rounds < max_rounds) {
        ++rounds;
        if (!run_once()) break;
    }
    return rounds;
}

void RuntimeNode::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    effects_->start();
    timers_->start();
    fabric_->start();
    th_ = std::thread([this] { world_loop(); });
    info() << "runtime node " << config_.worker_id << " started";
}

void RuntimeNode::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(cv_mu_);
    }
    cv_.notify_all();
    if (th_.joinable()) th_.join();
    effects_->stop();
    timers_->stop();
    fabric_->stop();

    std::lock_guard<std::mutex> lock(worlds_mu_);
    for (auto& kv : worlds_) kv.second->release();
    info() << "runtime node " << config_.worker_id << " stopped";
}

void RuntimeNode::world_loop() {
    Logger::get().setThreadName(config_.worker_id + "-worlds");
    while (running_.load()) {
        bool moved = step_worlds(false);
        if (moved) continue;
        std::unique_lock<std::mutex> lock(cv_mu_);
        cv_.wait_for(lock, std::chrono::milliseconds(config_.poll_interval_ms), [this] { return !running_.load(); });
    }
    Logger::get().flush();
}

} // namespace loom
