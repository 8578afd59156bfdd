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
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include "../core/records.h"

namespace loom {

struct AdapterResult {
    ReceiptStatus status = ReceiptStatus::Ok;
    std::string payload;
};

/**
 * External effect executor. Invoked only by delivery workers, never by the
 * kernel. May run more than once for the same intent; the intent hash is
 * available for adapters that can deduplicate on their side. Throwing
 * AdapterTimeoutError or any other exception signals failure.
 */
class Adapter {
public:
    virtual ~Adapter() = default;
    virtual std::string id() const = 0;
    virtual AdapterResult execute(const EffectIntent& intent) = 0;
};

// Maps effect names to adapters
class AdapterRegistry {
public:
    void register_adapter(const std::string& effect, std::shared_ptr<Adapter> adapter);
    std::shared_ptr<Adapter> find(const std::string& effect) const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<Adapter>> adapters_;
};

// Attempts within one claim; the queue's own attempts count claims
struct RetryPolicy {
    uint32_t max_attempts = 3;
    uint64_t initial_backoff_ms = 50;
    double multiplier = 2.0;
    uint64_t max_backoff_ms = 2000;
    bool retry_timeouts = true;

    uint64_t backoff_ms(uint32_t attempt) const;
};

} // namespace loom
