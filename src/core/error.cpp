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

#include "error.h"

namespace loom {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FencedWrite: return "FencedWrite";
        case ErrorKind::StaleHeight: return "StaleHeight";
        case ErrorKind::DuplicateIntent: return "DuplicateIntent";
        case ErrorKind::ClaimExpired: return "ClaimExpired";
        case ErrorKind::RootIncomplete: return "RootIncomplete";
        case ErrorKind::ReplayMismatch: return "ReplayMismatch";
        case ErrorKind::QuiescenceViolation: return "QuiescenceViolation";
        case ErrorKind::SelfCorrelationCycle: return "SelfCorrelationCycle";
        case ErrorKind::ReceiptHorizonViolation: return "ReceiptHorizonViolation";
        case ErrorKind::LeaseUnavailable: return "LeaseUnavailable";
        case ErrorKind::JournalGap: return "JournalGap";
        case ErrorKind::CommitConflict: return "CommitConflict";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Corrupt: return "Corrupt";
        case ErrorKind::AdapterError: return "AdapterError";
        case ErrorKind::AdapterTimeout: return "AdapterTimeout";
        case ErrorKind::ModuleFailure: return "ModuleFailure";
        case ErrorKind::Config: return "Config";
        case ErrorKind::PolicyDenied: return "PolicyDenied";
        case ErrorKind::ProposalInvalid: return "ProposalInvalid";
    }
    return "Unknown";
}

namespace {
std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += items[i];
    }
    return out;
}
} // namespace

std::string RootIncompleteError::describe(const std::vector<std::string>& missing) {
    return "snapshot references " + std::to_string(missing.size()) +
           " unresolvable root(s): " + join(missing);
}

std::string QuiescenceViolationError::describe(const std::vector<std::string>& instances,
                                               const std::vector<std::string>& intents) {
    std::string out = "manifest change blocked";
    if (!instances.empty()) out += "; non-terminal instances: " + join(instances);
    if (!intents.empty()) out += "; in-flight intents: " + join(intents);
    return out;
}

} // namespace loom
