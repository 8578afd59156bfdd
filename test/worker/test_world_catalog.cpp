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
#include "runtime_harness.h"
#include "../../src/core/error.h"

using namespace loom;

class WorldCatalogTest : public ::testing::Test {
protected:
    test::Cluster cluster_;
    std::unique_ptr<RuntimeNode> node_ = cluster_.node("n1");
    WorldCatalog& catalog_ = node_->catalog();

    void create_and_host(const std::string& world) {
        catalog_.create_world(world, "u", test::demo_manifest());
        node_->host_world(world);
    }

    static std::string state_of(const WorldState& ws, const std::string& id) {
        const WorkflowInstance* inst = ws.find_instance(id);
        return inst ? inst->state : "<missing>";
    }
};

TEST_F(WorldCatalogTest, CreateRegistersTheWorldAndQueuesItsManifest) {
    WorldMeta m = catalog_.create_world("beta", "u1", test::demo_manifest());
    catalog_.create_world("alpha", "u1", test::demo_manifest());

    EXPECT_EQ(m.world_id, "beta");
    EXPECT_EQ(m.universe_id, "u1");
    EXPECT_EQ(m.manifest_hash, test::demo_manifest().hash());
    EXPECT_TRUE(m.forked_from.empty());
    EXPECT_EQ(catalog_.list_worlds(), (std::vector<std::string>{"alpha", "beta"}));
    EXPECT_TRUE(cluster_.objects.contains(m.manifest_hash));

    WorldMeta stored;
    ASSERT_TRUE(catalog_.meta("beta", &stored));
    EXPECT_EQ(stored.encode(), m.encode());

    std::vector<InboxEntry> inbox = node_->services().inbox.peek("beta", 0);
    ASSERT_EQ(inbox.size(), 1u);
    EXPECT_EQ(inbox[0].dedupe_id, "genesis");
    EXPECT_EQ(inbox[0].record.kind, RecordKind::ManifestChange);
}

TEST_F(WorldCatalogTest, RejectsBadAndDuplicateIds) {
    EXPECT_FALSE(WorldCatalog::valid_world_id(""));
    EXPECT_FALSE(WorldCatalog::valid_world_id(".."));
    EXPECT_FALSE(WorldCatalog::valid_world_id("a/b"));
    EXPECT_FALSE(WorldCatalog::valid_world_id(std::string(129, 'a')));
    EXPECT_TRUE(WorldCatalog::valid_world_id("shard-01.eu_west"));

    EXPECT_THROW(catalog_.create_world("a/b", "u", test::demo_manifest()), ConfigError);
    catalog_.create_world("w", "u", test::demo_manifest());
    EXPECT_THROW(catalog_.create_world("w", "u", test::demo_manifest()), CommitConflictError);
    EXPECT_EQ(catalog_.list_worlds().size(), 1u);

    EXPECT_THROW(catalog_.submit_event("ghost", "note", "n", "x"), NotFoundError);
    EXPECT_THROW(catalog_.query_state("ghost"), NotFoundError);
}

TEST_F(WorldCatalogTest, GeneratedIngressIdsAreUnique) {
    create_and_host("w");
    EXPECT_EQ(catalog_.submit_event("w", "note", "n", "a"), EnqueueOutcome::Enqueued);
    EXPECT_EQ(catalog_.submit_event("w", "note", "n", "b"), EnqueueOutcome::Enqueued);
    node_->run_until_idle();
    EXPECT_EQ(state_of(catalog_.query_state("w"), "notes/n"), "a,b");
}

TEST_F(WorldCatalogTest, InjectedReceiptReleasesAnAwaitingInstance) {
    // Step the world by hand so the effect stays undelivered
    catalog_.create_world("w", "u", test::demo_manifest());
    WorldWorker worker("w", node_->services(), WorkerOptions::from(test::test_config("n1")));
    catalog_.submit_event("w", "order.placed", "a", "1", "", "order-1");
    worker.step();

    WorldState ws = catalog_.query_state("w");
    ASSERT_EQ(ws.pending.size(), 1u);
    const Hash intent = ws.pending.begin()->first;
    EXPECT_EQ(catalog_.inject_receipt("w", intent, IntentKind::Effect, ReceiptStatus::Ok, "manual"),
              EnqueueOutcome::Enqueued);
    worker.step();
    EXPECT_EQ(state_of(worker.world_state(), "orders/a"), "1:1");
    EXPECT_TRUE(worker.world_state().pending.empty());

    // The adapter still runs once, but its receipt is already accounted for
    EXPECT_EQ(node_->delivery(Pipeline::Effects).run_once(), 1u);
    EXPECT_EQ(cluster_.charge->calls(), 1);
    EXPECT_EQ(node_->services().inbox.depth("w"), 0u);
    EXPECT_EQ(node_->services().effects.inflight_count(), 0u);
    EXPECT_EQ(catalog_.query_state("w").encode(), worker.world_state().encode());
}

TEST_F(WorldCatalogTest, ManifestChangeWaitsForQuiescence) {
    create_and_host("w");
    catalog_.submit_event("w", "order.placed", "a", "1", "", "order-1");
    node_->run_once();

    Manifest next = test::demo_manifest();
    next.add_workflow(WorkflowDef{"audit", "notes", {"audit"}});
    try {
        catalog_.request_manifest_change("w", next);
        FAIL() << "manifest change admitted with work in flight";
    } catch (const QuiescenceViolationError& e) {
        EXPECT_EQ(e.blocking_instances(), std::vector<std::string>{"orders/a"});
        EXPECT_EQ(e.blocking_intents().size(), 1u);
        EXPECT_NE(std::string(e.what()).find("orders/a"), std::string::npos);
    }

    node_->run_until_idle();
    EXPECT_EQ(catalog_.request_manifest_change("w", test::demo_manifest()), test::demo_manifest().hash());
    EXPECT_EQ(node_->services().inbox.depth("w"), 0u);

    const Hash h = catalog_.request_manifest_change("w", next);
    EXPECT_EQ(h, next.hash());
    node_->run_until_idle();
    EXPECT_EQ(catalog_.query_state("w").manifest_hash, h);

    catalog_.submit_event("w", "audit", "x", "checked", "", "audit-1");
    node_->run_until_idle();
    EXPECT_EQ(state_of(catalog_.query_state("w"), "audit/x"), "checked");
}

TEST_F(WorldCatalogTest, ForkStartsFromTheSourceState) {
    create_and_host("w");
    catalog_.submit_event("w", "note", "n", "a", "", "n-1");
    catalog_.submit_event("w", "order.placed", "o", "1", "", "o-1");
    node_->run_until_idle();
    WorldState source = catalog_.query_state("w");

    WorldMeta m = catalog_.fork_world("w", "w2");
    EXPECT_EQ(m.forked_from, "w");
    EXPECT_EQ(m.fork_height, source.height);
    EXPECT_EQ(m.universe_id, "u");
    EXPECT_EQ(m.manifest_hash, source.manifest_hash);

    WorldState forked = catalog_.query_state("w2");
    EXPECT_EQ(forked.world_id, "w2");
    EXPECT_EQ(forked.height, source.height + 1);
    ASSERT_EQ(forked.instances.size(), source.instances.size());
    for (const auto& kv : source.instances) {
        EXPECT_EQ(forked.find_instance(kv.first)->encode(), kv.second.encode());
    }
    EXPECT_EQ(node_->services().inbox.depth("w2"), 0u);

    node_->host_world("w2");
    catalog_.submit_event("w2", "note", "n", "b", "", "n-2");
    node_->run_until_idle();
    EXPECT_EQ(state_of(node_->resident_state("w2"), "notes/n"), "a,b");
    EXPECT_EQ(state_of(node_->resident_state("w"), "notes/n"), "a");

    EXPECT_THROW(catalog_.fork_world("w", "w2"), CommitConflictError);
    EXPECT_THROW(catalog_.fork_world("ghost", "w3"), NotFoundError);
    EXPECT_THROW(catalog_.fork_world("w", "bad id"), ConfigError);
}

TEST_F(WorldCatalogTest, ForkRefusesInFlightIntents) {
    create_and_host("w");
    catalog_.submit_event("w", "order.placed", "a", "1", "", "order-1");
    node_->run_once();
    EXPECT_THROW(catalog_.fork_world("w", "w2"), QuiescenceViolationError);
    EXPECT_FALSE(catalog_.exists("w2"));
}

TEST_F(WorldCatalogTest, ProposalIsShadowedApprovedAndAppliedThroughTheJournal) {
    create_and_host("w");
    node_->run_until_idle();

    Manifest next = test::demo_manifest();
    next.add_workflow(WorkflowDef{"audit", "notes", {"audit"}});
    PolicyDef policy;
    policy.name = "no-timers";
    policy.rules.push_back(PolicyRule{"timer", "", "", "", PolicyDecision::Deny});
    policy.rules.push_back(PolicyRule{"", "", "", "", PolicyDecision::Allow});
    next.set_policy(policy);

    const uint64_t id = catalog_.propose_manifest("w", next, "add audit, stop timers");
    EXPECT_EQ(id, 0u);
    EXPECT_THROW(catalog_.propose_manifest("w", next, "again"), CommitConflictError);
    node_->run_until_idle();

    WorldState ws = catalog_.query_state("w");
    const Proposal* p = ws.find_proposal(id);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->state, ProposalState::Submitted);
    EXPECT_EQ(p->manifest_hash, next.hash());
    EXPECT_EQ(p->description, "add audit, stop timers");
    EXPECT_THROW(catalog_.approve_proposal("w", id, "ops"), ProposalStateError);
    EXPECT_THROW(catalog_.apply_proposal("w", id), ProposalStateError);
    EXPECT_THROW(catalog_.approve_proposal("w", 9, "ops"), NotFoundError);

    IngressRecord seed;
    seed.event_type = "timer.start";
    seed.instance_key = "t";
    seed.payload = "5";
    ShadowSummary summary = catalog_.shadow_proposal("w", id, {seed});
    EXPECT_EQ(summary.workflow_deltas, (std::vector<std::string>{"+audit", "~policy"}));
    EXPECT_TRUE(summary.predicted_effects.empty());
    EXPECT_EQ(summary.rejections, std::vector<std::string>{"PolicyDenied timers/t"});
    EXPECT_TRUE(summary.blockers.empty());
    node_->run_until_idle();
    EXPECT_EQ(catalog_.query_state("w").find_proposal(id)->state, ProposalState::Shadowed);
    EXPECT_EQ(catalog_.query_state("w").find_proposal(id)->shadow.workflow_deltas, summary.workflow_deltas);

    catalog_.approve_proposal("w", id, "ops");
    node_->run_until_idle();

    catalog_.submit_event("w", "order.placed", "a", "1", "", "order-1");
    node_->run_once();
    EXPECT_THROW(catalog_.apply_proposal("w", id), QuiescenceViolationError);
    node_->run_until_idle();
    catalog_.apply_proposal("w", id);
    node_->run_until_idle();

    ws = catalog_.query_state("w");
    EXPECT_EQ(ws.manifest_hash, next.hash());
    p = ws.find_proposal(id);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->state, ProposalState::Applied);
    EXPECT_EQ(p->approver, "ops");
    EXPECT_GT(p->applied_at, p->proposed_at);
    EXPECT_THROW(catalog_.apply_proposal("w", id), ProposalStateError);

    catalog_.submit_event("w", "timer.start", "t", "5", "", "timer-1");
    catalog_.submit_event("w", "audit", "x", "checked", "", "audit-1");
    node_->run_until_idle();
    ws = catalog_.query_state("w");
    EXPECT_EQ(ws.find_instance("timers/t")->status, InstanceStatus::Terminal);
    EXPECT_NE(ws.find_instance("timers/t")->last_error.find("denied by policy no-timers"), std::string::npos);
    EXPECT_EQ(state_of(ws, "audit/x"), "checked");
    EXPECT_EQ(catalog_.propose_manifest("w", test::demo_manifest(), "revert"), 1u);
}
