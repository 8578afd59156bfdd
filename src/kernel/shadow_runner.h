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

#include <string>
#include <vector>
#include "kernel.h"

namespace loom {

/**
 * Dry-runs a candidate manifest on a throwaway state: genesis, the
 * manifest, then the seed events, folded with the live kernel's modules
 * and object store. Nothing is journaled and the live state is only read.
 */
class ShadowRunner {
public:
    explicit ShadowRunner(Kernel& kernel);

    // Throws NotFoundError when either manifest is missing from the object store
    ShadowSummary run(const WorldState& live, const Hash& candidate, const std::vector<IngressRecord>& seeds);

    // +name added, -name removed, ~name changed; ~policy when the policy differs
    static std::vector<std::string> diff(const Manifest& from, const Manifest& to);

private:
    Kernel& kernel_;
};

} // namespace loom
