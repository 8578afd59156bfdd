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
#include <algorithm>
#include "../journal/world_fixture.h"
#include "../../src/core/error.h"

using namespace loom;

class SnapshotManagerTest : public test::WorldFixture {
protected:
    void populate() {
        install_manifest();
        commit(event("note", "n", "a"));
        commit(event("note", "m", "b"));
    }

    SnapshotResult snapshot_and_fold(const SnapshotManager::Pins& pins = SnapshotManager::Pins()) {
        SnapshotResult snap = snapshots_.create_snapshot(state_, epoch_, pins);
        kernel_.apply(state_, snap.marker_height, snap.marker);
        return snap;
    }
};

TEST_F(SnapshotManagerTest, CapturesEveryRootAndRebuildsTheState) {
    populate();
    const std::string before = state_.encode();
    const uint64_t height = state_.height;

    SnapshotResult snap = snapshot_and_fold();
    EXPECT_EQ(snap.marker_height, height);
    EXPECT_EQ(snap.marker.kind, RecordKind::SnapshotMarker);
    EXPECT_EQ(snap.marker.snapshot.snapshot_ref, snap.snapshot_ref);
    EXPECT_EQ(journal_.head("w"), height + 1);

    const SnapshotEnvelope& env = snap.envelope;
    EXPECT_EQ(env.height, height);
    EXPECT_EQ(env.manifest_hash, state_.manifest_hash);
    ASSERT_NE(env.find_root("manifest"), nullptr);
    ASSERT_NE(env.find_root("kernel"), nullptr);
    ASSERT_NE(env.find_root("workflow/notes"), nullptr);
    ASSERT_NE(env.find_root("instance/notes/n"), nullptr);
    ASSERT_NE(env.find_root("instance/notes/m"), nullptr);

    SnapshotEnvelope loaded = snapshots_.load_envelope(snap.snapshot_ref);
    EXPECT_EQ(loaded.encode(), env.encode());
    EXPECT_EQ(snapshots_.load_state(loaded).encode(), before);
}

TEST_F(SnapshotManagerTest, KeysWithSlashesRebuildEveryInstance) {
    install_manifest();
    commit(event("note", "a/b", "x"));
    commit(event("note", "a", "y"));
    commit(event("note", "a/b/", "z"));
    const std::string before = state_.encode();

    SnapshotResult snap = snapshot_and_fold();
    ASSERT_NE(snap.envelope.find_root("instance/notes/a/b"), nullptr);

    WorldState rebuilt = snapshots_.load_state(snapshots_.load_envelope(snap.snapshot_ref));
    EXPECT_EQ(rebuilt.instances.size(), 3u);
    EXPECT_EQ(rebuilt.encode(), before);
}

TEST_F(SnapshotManagerTest, CompletedIntentsStillDeduplicateAfterALoad) {
    host_.register_module("once", [](const std::string&, const WorkflowEvent& ev, const InvokeContext&) {
        ModuleOutput out;
        if (ev.source == EventSource::Event) {
            EffectRequest req;
            req.effect = "charge";
            req.idempotency_key = "fixed";
            out.effects.push_back(req);
        }
        return out;
    });
    Manifest m = test::demo_manifest();
    m.add_workflow(WorkflowDef{"once", "once", {"charge.once"}});
    commit(JournalRecord::of(ManifestChange{objects_.put(m.encode())}));

    ApplyResult first = commit(event("charge.once", "k", "1"));
    ASSERT_EQ(first.emitted.size(), 1u);
    commit_intents(first);
    commit(receipt(first.emitted[0]));
    ASSERT_TRUE(state_.pending.empty());
    ASSERT_EQ(state_.completed.count(first.emitted[0].intent_hash()), 1u);

    SnapshotResult snap = snapshot_and_fold();
    WorldState loaded = snapshots_.load_state(snapshots_.load_envelope(snap.snapshot_ref));
    kernel_.apply(loaded, snap.marker_height, snap.marker);
    EXPECT_EQ(loaded.completed, state_.completed);

    ApplyResult again = kernel_.apply(loaded, loaded.height, event("charge.once", "k", "2"));
    EXPECT_TRUE(again.emitted.empty());
    ASSERT_EQ(again.rejections.size(), 1u);
    EXPECT_EQ(again.rejections[0].kind, ErrorKind::DuplicateIntent);
    EXPECT_TRUE(loaded.pending.empty());
}

TEST_F(SnapshotManagerTest, MissingRootFailsTheLoad) {
    populate();
    SnapshotResult snap = snapshot_and_fold();
    ASSERT_TRUE(objects_.remove(snap.envelope.find_root("instance/notes/m")->hash));

    try {
        snapshots_.load_envelope(snap.snapshot_ref);
        FAIL() << "incomplete snapshot loaded";
    } catch (const RootIncompleteError& e) {
        ASSERT_EQ(e.missing().size(), 1u);
        EXPECT_EQ(e.missing()[0].find("instance/notes/m"), 0u);
    }
    EXPECT_THROW(snapshots_.load_envelope(sha256(std::string("no such envelope"))), NotFoundError);
}

TEST_F(SnapshotManagerTest, DanglingPinFailsTheWrite) {
    populate();
    const uint64_t head = journal_.head("w");
    SnapshotManager::Pins pins = {{"blob", sha256(std::string("never stored"))}};
    EXPECT_THROW(snapshots_.create_snapshot(state_, epoch_, pins), RootIncompleteError);
    EXPECT_EQ(journal_.head("w"), head);

    Hash stored = objects_.put("attachment");
    SnapshotResult snap = snapshot_and_fold({{"blob", stored}});
    ASSERT_NE(snap.envelope.find_root("pin/blob"), nullptr);
    EXPECT_EQ(snap.envelope.find_root("pin/blob")->hash, stored);
}

TEST_F(SnapshotManagerTest, StateMustBeAtTheHead) {
    populate();
    journal_.append("w", epoch_, state_.height, event("note", "n", "unfolded"));
    EXPECT_THROW(snapshots_.create_snapshot(state_, epoch_), StaleHeightError);
}

TEST_F(SnapshotManagerTest, OpenIntentsBelowTheSnapshotBlockPromotion) {
    install_manifest();
    ApplyResult placed = commit(event("order.placed", "o", "1"));
    commit_intents(placed);
    SnapshotResult snap = snapshot_and_fold();

    try {
        snapshots_.promote_baseline("w", epoch_, snap.snapshot_ref, state_);
        FAIL() << "baseline promoted over an open intent";
    } catch (const ReceiptHorizonViolationError& e) {
        ASSERT_EQ(e.open_intents().size(), 1u);
        EXPECT_EQ(e.open_intents()[0], placed.emitted[0].intent_hash().hex());
    }
    EXPECT_FALSE(snapshots_.baseline("w", nullptr));

    commit(receipt(placed.emitted[0]));
    EXPECT_TRUE(snapshots_.promote_baseline("w", epoch_, snap.snapshot_ref, state_));
    BaselineRecord b;
    ASSERT_TRUE(snapshots_.baseline("w", &b));
    EXPECT_EQ(b.snapshot_ref, snap.snapshot_ref);
    EXPECT_EQ(b.height, snap.envelope.height);
}

TEST_F(SnapshotManagerTest, BaselineOnlyMovesForward) {
    populate();
    SnapshotResult early = snapshot_and_fold();
    commit(event("note", "n", "c"));
    SnapshotResult late = snapshot_and_fold();

    EXPECT_TRUE(snapshots_.promote_baseline("w", epoch_, late.snapshot_ref, state_));
    EXPECT_FALSE(snapshots_.promote_baseline("w", epoch_, early.snapshot_ref, state_));
    EXPECT_FALSE(snapshots_.promote_baseline("w", epoch_, late.snapshot_ref, state_));

    BaselineRecord b;
    snapshots_.baseline("w", &b);
    EXPECT_EQ(b.height, late.envelope.height);
}

TEST_F(SnapshotManagerTest, PromotionIsFenced) {
    populate();
    SnapshotResult snap = snapshot_and_fold();
    advance_ms(6000);
    ASSERT_TRUE(leases_.acquire("w", "beta").granted);
    EXPECT_THROW(snapshots_.promote_baseline("w", epoch_, snap.snapshot_ref, state_), FencedWriteError);
    EXPECT_FALSE(snapshots_.baseline("w", nullptr));
}
