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
#include <string>
#include <vector>
#include "../../src/core/error.h"
#include "../../src/kernel/kernel.h"
#include "../../src/kernel/shadow_runner.h"
#include "../../src/persistence/object_store.h"
#include "../worker/runtime_harness.h"

using namespace loom;

class GovernanceTest : public ::testing::Test {
protected:
    persist::MemoryObjectStore objects_;
    NativeModuleHost host_;
    Kernel kernel_{objects_, host_};
    WorldState ws_;

    void SetUp() override {
        test::register_demo_modules(host_);
        ws_ = kernel_.genesis("w");
        fold(JournalRecord::of(ManifestChange{objects_.put(test::demo_manifest().encode())}));
    }

    ApplyResult fold(const JournalRecord& rec) { return kernel_.apply(ws_, ws_.height, rec); }

    static Manifest with_audit() {
        Manifest m = test::demo_manifest();
        m.add_workflow(WorkflowDef{"audit", "notes", {"audit"}});
        return m;
    }

    ApplyResult step(GovernanceAction action, uint64_t id, const Hash& manifest = Hash(),
                     const std::string& approver = "") {
        GovernanceRecord rec;
        rec.action = action;
        rec.proposal_id = id;
        rec.manifest_hash = manifest;
        rec.approver = approver;
        if (action == GovernanceAction::Shadow) {
            rec.shadow = ShadowRunner(kernel_).run(ws_, ws_.find_proposal(id)->manifest_hash, {});
        }
        return fold(JournalRecord::of(rec));
    }

    static JournalRecord event(const std::string& type, const std::string& key, const std::string& payload) {
        IngressRecord in;
        in.ingress_id = type + ":" + key;
        in.event_type = type;
        in.instance_key = key;
        in.payload = payload;
        in.logical_now_ns = 1000;
        return JournalRecord::of(in);
    }

    static ErrorKind only_rejection(const ApplyResult& r) {
        return r.rejections.size() == 1 ? r.rejections[0].kind : ErrorKind::Corrupt;
    }
};

TEST_F(GovernanceTest, ProposalWalksToAppliedAndSwapsTheManifest) {
    const Hash before = ws_.manifest_hash;
    const Hash next = objects_.put(with_audit().encode());

    EXPECT_TRUE(step(GovernanceAction::Propose, 0, next).rejections.empty());
    ASSERT_NE(ws_.find_proposal(0), nullptr);
    EXPECT_EQ(ws_.find_proposal(0)->state, ProposalState::Submitted);
    EXPECT_EQ(ws_.find_proposal(0)->proposed_at, 1u);
    EXPECT_EQ(ws_.next_proposal_id, 1u);

    // Out of order steps are recorded, not applied
    EXPECT_EQ(only_rejection(step(GovernanceAction::Apply, 0)), ErrorKind::ProposalInvalid);
    EXPECT_EQ(only_rejection(step(GovernanceAction::Approve, 0, Hash(), "ops")), ErrorKind::ProposalInvalid);
    EXPECT_EQ(ws_.manifest_hash, before);
    EXPECT_EQ(ws_.find_proposal(0)->state, ProposalState::Submitted);

    step(GovernanceAction::Shadow, 0);
    EXPECT_EQ(ws_.find_proposal(0)->state, ProposalState::Shadowed);
    EXPECT_EQ(ws_.find_proposal(0)->shadow.workflow_deltas, std::vector<std::string>{"+audit"});

    step(GovernanceAction::Approve, 0, Hash(), "ops");
    EXPECT_EQ(ws_.find_proposal(0)->state, ProposalState::Approved);
    EXPECT_EQ(ws_.find_proposal(0)->approver, "ops");

    const uint64_t apply_height = ws_.height;
    EXPECT_TRUE(step(GovernanceAction::Apply, 0).rejections.empty());
    EXPECT_EQ(ws_.manifest_hash, next);
    EXPECT_EQ(ws_.find_proposal(0)->state, ProposalState::Applied);
    EXPECT_EQ(ws_.find_proposal(0)->applied_at, apply_height);

    fold(event("audit", "x", "seen"));
    EXPECT_EQ(ws_.find_instance("audit/x")->state, "seen");
}

TEST_F(GovernanceTest, ApplyWaitsForQuiescenceAndStaysApproved) {
    ApplyResult order = fold(event("order.placed", "a", "1"));
    ASSERT_EQ(order.emitted.size(), 1u);

    step(GovernanceAction::Propose, 0, objects_.put(with_audit().encode()));
    step(GovernanceAction::Shadow, 0);
    EXPECT_EQ(ws_.find_proposal(0)->shadow.blockers.size(), 2u);
    step(GovernanceAction::Approve, 0, Hash(), "ops");

    ApplyResult blocked = step(GovernanceAction::Apply, 0);
    ASSERT_EQ(blocked.rejections.size(), 1u);
    EXPECT_EQ(blocked.rejections[0].kind, ErrorKind::QuiescenceViolation);
    EXPECT_EQ(blocked.rejections[0].subject, "proposal 0");
    EXPECT_NE(blocked.rejections[0].detail.find("orders/a"), std::string::npos);
    EXPECT_EQ(ws_.find_proposal(0)->state, ProposalState::Approved);

    ReceiptRecord r;
    r.intent_hash = order.emitted[0].intent_hash();
    r.payload = "ok";
    r.correlation = "pay";
    fold(JournalRecord::of(r));
    ASSERT_TRUE(ws_.non_terminal_instances().empty());

    EXPECT_TRUE(step(GovernanceAction::Apply, 0).rejections.empty());
    EXPECT_EQ(ws_.find_proposal(0)->state, ProposalState::Applied);
}

TEST_F(GovernanceTest, RejectedAndUnknownProposalsAreRecordedAsData) {
    const Hash next = objects_.put(with_audit().encode());
    step(GovernanceAction::Propose, 0, next);
    EXPECT_EQ(only_rejection(step(GovernanceAction::Propose, 0, next)), ErrorKind::ProposalInvalid);

    step(GovernanceAction::Shadow, 0);
    step(GovernanceAction::Reject, 0, Hash(), "security");
    EXPECT_EQ(ws_.find_proposal(0)->state, ProposalState::Rejected);
    EXPECT_EQ(ws_.find_proposal(0)->approver, "security");
    EXPECT_TRUE(ws_.find_proposal(0)->settled());

    GovernanceRecord reshadow;
    reshadow.action = GovernanceAction::Shadow;
    reshadow.proposal_id = 0;
    EXPECT_EQ(only_rejection(fold(JournalRecord::of(reshadow))), ErrorKind::ProposalInvalid);
    EXPECT_EQ(only_rejection(step(GovernanceAction::Apply, 0)), ErrorKind::ProposalInvalid);

    GovernanceRecord ghost;
    ghost.action = GovernanceAction::Approve;
    ghost.proposal_id = 7;
    EXPECT_EQ(only_rejection(fold(JournalRecord::of(ghost))), ErrorKind::NotFound);
    EXPECT_NE(ws_.manifest_hash, next);

    // Ids are taken from the record, so the next free one follows the highest seen
    step(GovernanceAction::Propose, 5, next);
    EXPECT_EQ(ws_.next_proposal_id, 6u);
}

TEST_F(GovernanceTest, ReshadowingDropsAnApproval) {
    step(GovernanceAction::Propose, 0, objects_.put(with_audit().encode()));
    step(GovernanceAction::Shadow, 0);
    step(GovernanceAction::Approve, 0, Hash(), "ops");
    step(GovernanceAction::Shadow, 0);
    EXPECT_EQ(ws_.find_proposal(0)->state, ProposalState::Shadowed);
    EXPECT_TRUE(ws_.find_proposal(0)->approver.empty());
    EXPECT_EQ(only_rejection(step(GovernanceAction::Apply, 0)), ErrorKind::ProposalInvalid);
}

TEST_F(GovernanceTest, ProposalsAreCarriedByTheStateEncoding) {
    step(GovernanceAction::Propose, 0, objects_.put(with_audit().encode()));
    step(GovernanceAction::Shadow, 0);
    step(GovernanceAction::Propose, 1, objects_.put(test::demo_manifest().encode()));

    WorldState back = WorldState::decode(ws_.encode());
    EXPECT_EQ(back.state_hash(), ws_.state_hash());
    ASSERT_EQ(back.proposals.size(), 2u);
    EXPECT_EQ(back.next_proposal_id, 2u);
    EXPECT_EQ(back.find_proposal(0)->shadow.workflow_deltas, std::vector<std::string>{"+audit"});
    EXPECT_EQ(back.find_proposal(1)->state, ProposalState::Submitted);

    WorldState without = ws_;
    without.proposals.erase(1);
    EXPECT_NE(without.state_hash(), ws_.state_hash());
}

TEST_F(GovernanceTest, ShadowRunPredictsWithoutTouchingTheLiveState) {
    fold(event("order.placed", "a", "1"));
    const Hash live_hash = ws_.state_hash();

    Manifest candidate = test::demo_manifest();
    PolicyDef policy;
    policy.name = "no-timers";
    policy.rules.push_back(PolicyRule{"timer", "", "", "", PolicyDecision::Deny});
    policy.rules.push_back(PolicyRule{"", "", "", "", PolicyDecision::Allow});
    candidate.set_policy(policy);

    IngressRecord order;
    order.event_type = "order.placed";
    order.instance_key = "x";
    order.payload = "2";
    IngressRecord timer;
    timer.event_type = "timer.start";
    timer.instance_key = "t";
    timer.payload = "5";

    ShadowSummary s = ShadowRunner(kernel_).run(ws_, objects_.put(candidate.encode()), {order, timer});
    ASSERT_EQ(s.predicted_effects.size(), 2u);
    EXPECT_EQ(s.predicted_effects[0].rfind("effect:charge:", 0), 0u);
    EXPECT_EQ(s.rejections, std::vector<std::string>{"PolicyDenied timers/t"});
    EXPECT_EQ(s.workflow_deltas, std::vector<std::string>{"~policy"});
    ASSERT_EQ(s.blockers.size(), 2u);
    EXPECT_EQ(s.blockers[0], "orders/a");
    EXPECT_EQ(s.blockers[1], "intent:" + ws_.pending.begin()->first.hex());

    EXPECT_EQ(ws_.state_hash(), live_hash);
    EXPECT_THROW(ShadowRunner(kernel_).run(ws_, sha256(std::string("missing")), {}), NotFoundError);
}

TEST(ShadowRunnerTest, DiffNamesAddedRemovedAndChangedWorkflows) {
    Manifest from;
    from.add_workflow(WorkflowDef{"a", "m", {"e1"}});
    from.add_workflow(WorkflowDef{"b", "m", {"e2"}});
    from.add_workflow(WorkflowDef{"c", "m", {"e3"}});
    Manifest to;
    to.add_workflow(WorkflowDef{"a", "m", {"e1"}});
    to.add_workflow(WorkflowDef{"b", "m2", {"e2"}});
    to.add_workflow(WorkflowDef{"d", "m", {"e4"}});

    EXPECT_EQ(ShadowRunner::diff(from, to), (std::vector<std::string>{"~b", "-c", "+d"}));
    EXPECT_TRUE(ShadowRunner::diff(from, from).empty());
}
