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

#include <gtest/gtest.h>
#include "world_fixture.h"
#include "../../src/core/error.h"

using namespace loom;

class JournalTest : public test::WorldFixture {};

TEST_F(JournalTest, AppendsAreContiguousAndReadInOrder) {
    EXPECT_EQ(journal_.head("w"), 0u);
    EXPECT_EQ(journal_.append("w", epoch_, 0, event("note", "a", "1")), 0u);
    EXPECT_EQ(journal_.append("w", epoch_, 1, event("note", "a", "2")), 1u);
    EXPECT_EQ(journal_.append("w", epoch_, 2, event("note", "a", "3")), 2u);
    EXPECT_EQ(journal_.head("w"), 3u);
    EXPECT_EQ(journal_.first_height("w"), 0u);

    std::vector<JournalEntry> all = journal_.read("w", 0);
    ASSERT_EQ(all.size(), 3u);
    for (uint64_t h = 0; h < 3; ++h) {
        EXPECT_EQ(all[h].height, h);
        EXPECT_EQ(all[h].record.ingress.payload, std::to_string(h + 1));
    }

    std::vector<JournalEntry> one = journal_.read("w", 1, 1);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0].height, 1u);
    EXPECT_TRUE(journal_.read("other", 0).empty());
}

TEST_F(JournalTest, ExpectedHeightMustMatchTheHead) {
    journal_.append("w", epoch_, 0, event("note", "a"));
    try {
        journal_.append("w", epoch_, 0, event("note", "b"));
        FAIL() << "stale append was admitted";
    } catch (const StaleHeightError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::StaleHeight);
    }
    EXPECT_THROW(journal_.append("w", epoch_, 5, event("note", "c")), StaleHeightError);
    EXPECT_EQ(journal_.head("w"), 1u);
    EXPECT_EQ(journal_.read("w", 0).size(), 1u);
}

TEST_F(JournalTest, DeposedWriterIsFenced) {
    journal_.append("w", epoch_, 0, event("note", "a"));
    advance_ms(6000);
    LeaseGrant g = leases_.acquire("w", "beta");
    ASSERT_TRUE(g.granted);

    EXPECT_THROW(journal_.append("w", epoch_, 1, event("note", "late")), FencedWriteError);
    EXPECT_EQ(journal_.head("w"), 1u);
    EXPECT_EQ(journal_.append("w", g.epoch, 1, event("note", "new")), 1u);
}

TEST_F(JournalTest, BatchIsAllOrNothing) {
    std::vector<JournalRecord> batch = {event("note", "a", "1"), event("note", "a", "2")};
    EXPECT_EQ(journal_.append_batch("w", epoch_, 0, batch), 2u);
    EXPECT_EQ(journal_.append_batch("w", epoch_, 2, {}), 2u);

    EXPECT_THROW(journal_.append_batch("w", epoch_, 1, batch), StaleHeightError);
    EXPECT_EQ(journal_.head("w"), 2u);

    persist::Transaction txn;
    EXPECT_EQ(journal_.stage_append(txn, "w", epoch_, 2, event("note", "b")), 2u);
    EXPECT_EQ(journal_.stage_append(txn, "w", epoch_, 3, event("note", "c")), 3u);
    EXPECT_THROW(journal_.stage_append(txn, "w", epoch_, 9, event("note", "d")), StaleHeightError);
    kv_.commit(txn);
    EXPECT_EQ(journal_.head("w"), 4u);
}

TEST_F(JournalTest, KeysSortByHeightAcrossSegments) {
    EXPECT_LT(Journal::entry_key("w", 9), Journal::entry_key("w", 10));
    EXPECT_LT(Journal::entry_key("w", 4095), Journal::entry_key("w", 4096));
    EXPECT_EQ(Journal::segment_of(4095), 0u);
    EXPECT_EQ(Journal::segment_of(4096), 1u);

    std::vector<JournalRecord> batch(4100, event("note", "a", "x"));
    ASSERT_EQ(journal_.append_batch("w", epoch_, 0, batch), 4100u);
    std::vector<JournalEntry> span = journal_.read("w", 4094, 4);
    ASSERT_EQ(span.size(), 4u);
    for (size_t i = 0; i < span.size(); ++i) EXPECT_EQ(span[i].height, 4094 + i);
}

TEST_F(JournalTest, InitialEntryStartsAboveGenesis) {
    persist::Transaction txn;
    journal_.stage_initial(txn, "fork", 17, event("note", "a"));
    kv_.commit(txn);
    EXPECT_EQ(journal_.head("fork"), 18u);
    EXPECT_EQ(journal_.first_height("fork"), 17u);

    persist::Transaction again;
    journal_.stage_initial(again, "fork", 30, event("note", "b"));
    EXPECT_THROW(kv_.commit(again), CommitConflictError);
}

TEST_F(JournalTest, RestoreFromGenesisMatchesLiveFold) {
    install_manifest();
    commit(event("note", "n", "a"));
    commit_intents(commit(event("order.placed", "o", "2")));
    commit(event("note.close", "n", "b"));

    RestoreStats stats;
    WorldState restored = replayer_.restore("w", &stats);
    EXPECT_FALSE(stats.from_baseline);
    EXPECT_EQ(stats.records_folded, state_.height);
    EXPECT_EQ(restored.encode(), state_.encode());
}

TEST_F(JournalTest, MissingEntryIsAGap) {
    install_manifest();
    commit(event("note", "n", "a"));
    commit(event("note", "n", "b"));

    persist::Transaction txn;
    txn.erase(Journal::entry_key("w", 1));
    kv_.commit(txn);

    EXPECT_THROW(replayer_.fold_from_genesis("w"), JournalGapError);
}

TEST_F(JournalTest, RestoreUsesBaselinePlusTail) {
    install_manifest();
    for (int i = 0; i < 5; ++i) commit(event("note", "n", std::to_string(i)));
    SnapshotResult snap = snapshots_.create_snapshot(state_, epoch_);
    kernel_.apply(state_, snap.marker_height, snap.marker);
    ASSERT_TRUE(snapshots_.promote_baseline("w", epoch_, snap.snapshot_ref, state_));
    commit(event("note", "n", "after"));

    RestoreStats stats;
    WorldState restored = replayer_.restore("w", &stats);
    EXPECT_TRUE(stats.from_baseline);
    EXPECT_EQ(stats.baseline_height, snap.envelope.height);
    EXPECT_EQ(stats.records_folded, 2u);
    EXPECT_EQ(restored.encode(), state_.encode());

    VerifyReport report = replayer_.verify("w");
    EXPECT_TRUE(report.from_genesis);
    EXPECT_EQ(report.height, state_.height);
    EXPECT_EQ(report.state_hash, state_.state_hash());
}

TEST_F(JournalTest, EveryBaselineFoldsToTheFullHistoryAtEveryHeight) {
    install_manifest();
    std::vector<SnapshotResult> snaps;
    for (int round = 0; round < 3; ++round) {
        const std::string n = std::to_string(round);
        commit(event("note", "n" + n, "a"));
        ApplyResult placed = commit(event("order.placed", "o" + n, "2"));
        ASSERT_EQ(placed.emitted.size(), 2u);
        commit_intents(placed);
        commit(receipt(placed.emitted[0]));
        commit(receipt(placed.emitted[1]));

        SnapshotResult snap = snapshots_.create_snapshot(state_, epoch_);
        kernel_.apply(state_, snap.marker_height, snap.marker);
        ASSERT_TRUE(snapshots_.promote_baseline("w", epoch_, snap.snapshot_ref, state_));
        snaps.push_back(snap);

        commit(event("note", "n", n));
    }
    const uint64_t head = journal_.head("w");
    ASSERT_EQ(head, state_.height);

    // expected[h] is the genesis fold of the first h records
    std::vector<std::string> expected;
    WorldState full = kernel_.genesis("w");
    expected.push_back(full.encode());
    for (uint64_t h = 1; h <= head; ++h) {
        replayer_.fold_until(full, h);
        expected.push_back(full.encode());
    }
    EXPECT_EQ(expected.back(), state_.encode());
    EXPECT_THROW(replayer_.fold_until(full, head + 1), JournalGapError);

    for (const auto& snap : snaps) {
        const uint64_t base = snap.envelope.height;
        WorldState from_base = snapshots_.load_state(snapshots_.load_envelope(snap.snapshot_ref));
        ASSERT_EQ(from_base.encode(), expected[base]);
        for (uint64_t h = base + 1; h <= head; ++h) {
            replayer_.fold_until(from_base, h);
            ASSERT_EQ(from_base.encode(), expected[h]) << "baseline " << base << " diverges at height " << h;
        }
    }

    RestoreStats stats;
    EXPECT_EQ(replayer_.restore("w", &stats).encode(), state_.encode());
    EXPECT_EQ(stats.baseline_height, snaps.back().envelope.height);
}

TEST_F(JournalTest, VerifyCatchesADivergentBaseline) {
    install_manifest();
    commit(event("note", "n", "real"));

    // A snapshot of a different history at the same height
    Kernel other(objects_, host_);
    WorldState fake = other.genesis("w");
    other.apply(fake, 0, JournalRecord::of(ManifestChange{state_.manifest_hash}));
    other.apply(fake, 1, event("note", "n", "forged"));
    SnapshotEnvelope env;
    Hash ref = snapshots_.write_envelope(fake, SnapshotManager::Pins(), &env);

    BaselineRecord b;
    b.snapshot_ref = ref;
    b.height = env.height;
    b.manifest_hash = env.manifest_hash;
    persist::Transaction txn;
    SnapshotManager::stage_baseline(txn, "w", b);
    kv_.commit(txn);

    EXPECT_THROW(replayer_.verify("w"), ReplayMismatchError);
}
