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
#include <stdexcept>
#include <string>
#include <vector>

namespace loom {

/**
 * Failure taxonomy shared by every runtime component.
 *
 * Kinds that describe rejected mutations (FencedWrite, StaleHeight,
 * CommitConflict) leave committed state untouched. ReplayMismatch,
 * RootIncomplete and JournalGap are fatal for the affected world and are
 * always surfaced to the operator. AdapterError and AdapterTimeout never
 * cross into the kernel as exceptions; delivery turns them into receipts.
 * PolicyDenied and ProposalInvalid are decided inside the fold and kept
 * as data on the world; the catalog also raises ProposalInvalid eagerly.
 */
enum class ErrorKind : uint8_t {
    FencedWrite = 1,
    StaleHeight,
    DuplicateIntent,
    ClaimExpired,
    RootIncomplete,
    ReplayMismatch,
    QuiescenceViolation,
    SelfCorrelationCycle,
    ReceiptHorizonViolation,
    LeaseUnavailable,
    JournalGap,
    CommitConflict,
    NotFound,
    Corrupt,
    AdapterError,
    AdapterTimeout,
    ModuleFailure,
    Config,
    PolicyDenied,
    ProposalInvalid
};

const char* error_kind_name(ErrorKind kind);

class RuntimeError : public std::runtime_error {
public:
    RuntimeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message),
          kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class FencedWriteError : public RuntimeError {
public:
    FencedWriteError(const std::string& world, uint64_t presented_epoch, uint64_t current_epoch)
        : RuntimeError(ErrorKind::FencedWrite,
                       "world " + world + " epoch " + std::to_string(presented_epoch) +
                       " is not current (current " + std::to_string(current_epoch) + ")"),
          world_(world), presented_epoch_(presented_epoch), current_epoch_(current_epoch) {}

    const std::string& world() const { return world_; }
    uint64_t presented_epoch() const { return presented_epoch_; }
    uint64_t current_epoch() const { return current_epoch_; }

private:
    std::string world_;
    uint64_t presented_epoch_;
    uint64_t current_epoch_;
};

class StaleHeightError : public RuntimeError {
public:
    StaleHeightError(const std::string& world, uint64_t expected, uint64_t actual)
        : RuntimeError(ErrorKind::StaleHeight,
                       "world " + world + " expected height " + std::to_string(expected) +
                       " but head is " + std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    uint64_t expected() const { return expected_; }
    uint64_t actual() const { return actual_; }

private:
    uint64_t expected_;
    uint64_t actual_;
};

class RootIncompleteError : public RuntimeError {
public:
    explicit RootIncompleteError(const std::vector<std::string>& missing)
        : RuntimeError(ErrorKind::RootIncomplete, describe(missing)), missing_(missing) {}

    const std::vector<std::string>& missing() const { return missing_; }

private:
    static std::string describe(const std::vector<std::string>& missing);
    std::vector<std::string> missing_;
};

class ReplayMismatchError : public RuntimeError {
public:
    ReplayMismatchError(const std::string& world, uint64_t height, const std::string& detail)
        : RuntimeError(ErrorKind::ReplayMismatch,
                       "world " + world + " diverged at height " + std::to_string(height) + ": " + detail),
          height_(height) {}

    uint64_t height() const { return height_; }

private:
    uint64_t height_;
};

/**
 * Governance apply rejected because the world is not quiescent. Carries
 * the exact blockers: non-terminal instance ids and in-flight intent hashes.
 */
class QuiescenceViolationError : public RuntimeError {
public:
    QuiescenceViolationError(const std::vector<std::string>& instances,
                             const std::vector<std::string>& intents)
        : RuntimeError(ErrorKind::QuiescenceViolation, describe(instances, intents)),
          blocking_instances_(instances), blocking_intents_(intents) {}

    const std::vector<std::string>& blocking_instances() const { return blocking_instances_; }
    const std::vector<std::string>& blocking_intents() const { return blocking_intents_; }

private:
    static std::string describe(const std::vector<std::string>& instances,
                                const std::vector<std::string>& intents);
    std::vector<std::string> blocking_instances_;
    std::vector<std::string> blocking_intents_;
};

class SelfCorrelationCycleError : public RuntimeError {
public:
    SelfCorrelationCycleError(const std::string& instance, const std::string& correlation)
        : RuntimeError(ErrorKind::SelfCorrelationCycle,
                       "instance " + instance + " would await its own reply on correlation '" +
                       correlation + "'"),
          instance_(instance), correlation_(correlation) {}

    const std::string& instance() const { return instance_; }
    const std::string& correlation() const { return correlation_; }

private:
    std::string instance_;
    std::string correlation_;
};

class ReceiptHorizonViolationError : public RuntimeError {
public:
    ReceiptHorizonViolationError(uint64_t snapshot_height, const std::vector<std::string>& open_intents)
        : RuntimeError(ErrorKind::ReceiptHorizonViolation,
                       std::to_string(open_intents.size()) + " intent(s) emitted below height " +
                       std::to_string(snapshot_height) + " have no terminal receipt"),
          open_intents_(open_intents) {}

    const std::vector<std::string>& open_intents() const { return open_intents_; }

private:
    std::vector<std::string> open_intents_;
};

class JournalGapError : public RuntimeError {
public:
    JournalGapError(const std::string& world, uint64_t expected_height, const std::string& detail)
        : RuntimeError(ErrorKind::JournalGap,
                       "world " + world + " missing journal height " +
                       std::to_string(expected_height) + ": " + detail) {}
};

class CommitConflictError : public RuntimeError {
public:
    explicit CommitConflictError(const std::string& key)
        : RuntimeError(ErrorKind::CommitConflict, "precondition failed on key " + key), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class ClaimExpiredError : public RuntimeError {
public:
    explicit ClaimExpiredError(const std::string& key)
        : RuntimeError(ErrorKind::ClaimExpired, "claim on " + key + " is no longer current") {}
};

class LeaseUnavailableError : public RuntimeError {
public:
    LeaseUnavailableError(const std::string& world, const std::string& holder)
        : RuntimeError(ErrorKind::LeaseUnavailable, "world " + world + " is leased by " + holder) {}
};

// Thrown by adapters; delivery turns both into receipts.
class AdapterError : public RuntimeError {
public:
    explicit AdapterError(const std::string& what)
        : RuntimeError(ErrorKind::AdapterError, what) {}
};

class AdapterTimeoutError : public RuntimeError {
public:
    explicit AdapterTimeoutError(const std::string& what)
        : RuntimeError(ErrorKind::AdapterTimeout, what) {}
};

class NotFoundError : public RuntimeError {
public:
    explicit NotFoundError(const std::string& what)
        : RuntimeError(ErrorKind::NotFound, what) {}
};

class CorruptError : public RuntimeError {
public:
    explicit CorruptError(const std::string& what)
        : RuntimeError(ErrorKind::Corrupt, what) {}
};

class ConfigError : public RuntimeError {
public:
    explicit ConfigError(const std::string& what)
        : RuntimeError(ErrorKind::Config, what) {}
};

class ProposalStateError : public RuntimeError {
public:
    ProposalStateError(uint64_t proposal_id, const std::string& state, const std::string& required)
        : RuntimeError(ErrorKind::ProposalInvalid,
                       "proposal " + std::to_string(proposal_id) + " is " + state + ", needs " + required),
          proposal_id_(proposal_id) {}

    uint64_t proposal_id() const { return proposal_id_; }

private:
    uint64_t proposal_id_;
};

} // namespace loom
