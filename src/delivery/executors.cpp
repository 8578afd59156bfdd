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

#include "executors.h"
#include "../core/error.h"
#include "../util/log.h"
#include <chrono>
#include <thread>

namespace loom {

InboxDelivery receipt_delivery(const EffectIntent& intent, ReceiptStatus status, const std::string& adapter_id,
                               const std::string& payload, uint64_t logical_now_ns) {
    ReceiptRecord r;
    r.intent_hash = intent.intent_hash();
    r.kind = intent.kind;
    r.status = status;
    r.adapter_id = adapter_id;
    r.payload = payload;
    r.correlation = intent.correlation;
    r.logical_now_ns = logical_now_ns;

    InboxDelivery d;
    d.world = intent.origin_world;
    d.dedupe_id = Inbox::receipt_id(r.intent_hash);
    d.record = JournalRecord::of(r);
    return d;
}

EffectExecutor::EffectExecutor(const AdapterRegistry& registry, RetryPolicy policy, uint32_t max_claims,
                               Sleeper sleeper)
    : registry_(registry), policy_(policy), max_claims_(max_claims), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](uint64_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); };
    }
}

std::vector<InboxDelivery> EffectExecutor::execute(const DispatchItem& item) {
    const EffectIntent& intent = item.intent;
    std::shared_ptr<Adapter> adapter = registry_.find(intent.effect);
    if (!adapter) {
        warning() << "no adapter for effect " << intent.effect << "; failing " << intent.intent_hash().short_hex();
        return {receipt_delivery(intent, ReceiptStatus::Error, "", "no adapter for " + intent.effect)};
    }
    if (max_claims_ && item.attempts > max_claims_) {
        warning() << "effect " << intent.effect << " " << intent.intent_hash().short_hex() << " gave up after "
                  << (item.attempts - 1) << " claims";
        return {receipt_delivery(intent, ReceiptStatus::Error, adapter->id(),
                                 "gave up after " + std::to_string(item.attempts - 1) + " claims")};
    }

    ReceiptStatus status = ReceiptStatus::Error;
    std::string payload;
    const uint32_t attempts = policy_.max_attempts ? policy_.max_attempts : 1;
    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        bool retry = false;
        try {
            AdapterResult res = adapter->execute(intent);
            status = res.status;
            payload = res.payload;
            retry = false;
        } catch (const AdapterTimeoutError& e) {
            status = ReceiptStatus::Timeout;
            payload = e.what();
            retry = policy_.retry_timeouts;
        } catch (const std::exception& e) {
            status = ReceiptStatus::Error;
            payload = e.what();
            retry = true;
        }
        if (!retry || attempt == attempts) break;
        uint64_t wait = policy_.backoff_ms(attempt);
        debug() << "adapter " << adapter->id() << " attempt " << attempt << " for "
                << intent.intent_hash().short_hex() << " failed (" << payload << "); retrying in " << wait << "ms";
        if (wait) sleeper_(wait);
    }
    return {receipt_delivery(intent, status, adapter->id(), payload)};
}

std::vector<InboxDelivery> TimerExecutor::execute(const DispatchItem& item) {
    return {receipt_delivery(item.intent, ReceiptStatus::Ok, "timer", std::string(), item.intent.deliver_at_ns)};
}

FabricExecutor::FabricExecutor(WorldExists exists) : exists_(std::move(exists)) {}

std::vector<InboxDelivery> FabricExecutor::execute(const DispatchItem& item) {
    const EffectIntent& intent = item.intent;
    if (exists_ && !exists_(intent.dest_world)) {
        warning() << "fabric message " << intent.effective_message_id() << " to unknown world " << intent.dest_world;
        return {receipt_delivery(intent, ReceiptStatus::Error, "fabric", "unknown world " + intent.dest_world)};
    }

    IngressRecord msg;
    msg.kind = IngressKind::Fabric;
    msg.ingress_id = intent.effective_message_id();
    msg.event_type = intent.effect;
    msg.instance_key = intent.dest_key;
    msg.correlation = intent.correlation;
    msg.payload = intent.params;
    msg.source_world = intent.origin_world;
    msg.dest_workflow = intent.dest_workflow;

    InboxDelivery message;
    message.world = intent.dest_world;
    message.dedupe_id = Inbox::message_id(msg.ingress_id);
    message.record = JournalRecord::of(msg);

    return {message, receipt_delivery(intent, ReceiptStatus::Ok, "fabric", std::string())};
}

} // namespace loom
