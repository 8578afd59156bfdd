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

#include "module_host.h"
#include "../core/error.h"
#include <mutex>

namespace loom {

void NativeModuleHost::register_module(const std::string& name, ModuleFn fn) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    modules_[name] = std::move(fn);
}

bool NativeModuleHost::has_module(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return modules_.count(name) != 0;
}

ModuleOutput NativeModuleHost::invoke(const std::string& module, const std::string& state,
                                      const WorkflowEvent& event, const InvokeContext& ctx) {
    ModuleFn fn;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = modules_.find(module);
        if (it == modules_.end()) throw NotFoundError("module " + module + " is not registered");
        fn = it->second;
    }
    return fn(state, event, ctx);
}

} // namespace loom
