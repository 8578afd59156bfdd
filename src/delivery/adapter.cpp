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

#include "adapter.h"
#include <mutex>

namespace loom {

void AdapterRegistry::register_adapter(const std::string& effect, std::shared_ptr<Adapter> adapter) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    adapters_[effect] = std::move(adapter);
}

std::shared_ptr<Adapter> AdapterRegistry::find(const std::string& effect) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = adapters_.find(effect);
    return it == adapters_.end() ? nullptr : it->second;
}

uint64_t RetryPolicy::backoff_ms(uint32_t attempt) const {
    double ms = static_cast<double>(initial_backoff_ms);
    for (uint32_t i = 1; i < attempt; ++i) ms *= multiplier;
    if (ms > static_cast<double>(max_backoff_ms)) ms = static_cast<double>(max_backoff_ms);
    return static_cast<uint64_t>(ms);
}

} // namespace loom
