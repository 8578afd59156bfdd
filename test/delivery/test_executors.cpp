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
#include <gmock/gmock.h>
#include <chrono>
#include <memory>
#include <thread>
#include "../manual_clock.h"
#include "../../src/core/error.h"
#include "../../src/delivery/delivery_worker.h"
#include "../../src/delivery/executors.h"
#include "../../src/lease/lease_manager.h"
#include "../../src/persistence/memory_kv_store.h"

using namespace loom;
using loom::test::ManualClock;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockAdapter : public Adapter {
public:
    MockAdapter() {
        ON_CALL(*this, id()).WillByDefault(Return(std::string("mock")));
    }
    MOCK_METHOD(std::string, id, (), (const, override));
    MOCK_METHOD(AdapterResult, execute, (const EffectIntent& intent), (override));
};

EffectIntent charge() {
    EffectIntent i;
    i.effect = "charge";
    i.params = "42";
    i.origin_world = "w";
    i.origin_workflow = "orders";
    i.origin_key = "a";
    i.correlation = "pay";
    i.idempotency_key = "0";
    return i;
}

AdapterResult result(ReceiptStatus status, const std::string& payload) {
    AdapterResult r;
    r.status = status;
    r.payload = payload;
    return r;
}

} // namespace

class EffectExecutorTest : public ::testing::Test {
protected:
    AdapterRegistry registry_;
    std::shared_ptr<::testing::NiceMock<MockAdapter>> adapter_ =
        std::make_shared<::testing::NiceMock<MockAdapter>>();
    std::vector<uint64_t> sleeps_;
    RetryPolicy policy_;

    void SetUp() override {
        registry_.register_adapter("charge", adapter_);
    }

    EffectExecutor executor(uint32_t max_claims = 0) {
        return EffectExecutor(registry_, policy_, max_claims, [this](uint64_t ms) { sleeps_.push_back(ms); });
    }

    static DispatchItem item(uint32_t attempts = 1) {
        DispatchItem it;
        it.intent = charge();
        it.attempts = attempts;
        return it;
    }

    static const ReceiptRecord& receipt_of(const std::vector<InboxDelivery>& out) {
        return out.at(0).record.receipt;
    }
};

TEST_F(EffectExecutorTest, SuccessBecomesAnOkReceiptForTheOrigin) {
    EXPECT_CALL(*adapter_, execute(_)).WillOnce(Return(result(ReceiptStatus::Ok, "paid")));
    std::vector<InboxDelivery> out = executor().execute(item());

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].world, "w");
    EXPECT_EQ(out[0].dedupe_id, Inbox::receipt_id(charge().intent_hash()));
    EXPECT_EQ(out[0].record.kind, RecordKind::Receipt);
    EXPECT_EQ(receipt_of(out).status, ReceiptStatus::Ok);
    EXPECT_EQ(receipt_of(out).payload, "paid");
    EXPECT_EQ(receipt_of(out).adapter_id, "mock");
    EXPECT_EQ(receipt_of(out).correlation, "pay");
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(EffectExecutorTest, FailuresAreRetriedWithBackoff) {
    EXPECT_CALL(*adapter_, execute(_))
        .WillOnce(Throw(AdapterError("connection reset")))
        .WillOnce(Throw(std::runtime_error("503")))
        .WillOnce(Return(result(ReceiptStatus::Ok, "paid")));
    std::vector<InboxDelivery> out = executor().execute(item());

    EXPECT_EQ(receipt_of(out).status, ReceiptStatus::Ok);
    EXPECT_EQ(sleeps_, (std::vector<uint64_t>{50, 100}));
}

TEST_F(EffectExecutorTest, PersistentTimeoutBecomesATimeoutReceipt) {
    EXPECT_CALL(*adapter_, execute(_)).Times(3).WillRepeatedly(Throw(AdapterTimeoutError("deadline exceeded")));
    std::vector<InboxDelivery> out = executor().execute(item());
    EXPECT_EQ(receipt_of(out).status, ReceiptStatus::Timeout);
    EXPECT_NE(receipt_of(out).payload.find("deadline exceeded"), std::string::npos);
}

TEST_F(EffectExecutorTest, TimeoutsCanBeFinal) {
    policy_.retry_timeouts = false;
    EXPECT_CALL(*adapter_, execute(_)).WillOnce(Throw(AdapterTimeoutError("deadline exceeded")));
    EXPECT_EQ(receipt_of(executor().execute(item())).status, ReceiptStatus::Timeout);
}

TEST_F(EffectExecutorTest, ReportedErrorIsNotRetried) {
    EXPECT_CALL(*adapter_, execute(_)).WillOnce(Return(result(ReceiptStatus::Error, "card declined")));
    std::vector<InboxDelivery> out = executor().execute(item());
    EXPECT_EQ(receipt_of(out).status, ReceiptStatus::Error);
    EXPECT_EQ(receipt_of(out).payload, "card declined");
}

TEST_F(EffectExecutorTest, MissingAdapterFailsTheIntent) {
    AdapterRegistry empty;
    EffectExecutor exec(empty, policy_, 0);
    std::vector<InboxDelivery> out = exec.execute(item());
    EXPECT_EQ(receipt_of(out).status, ReceiptStatus::Error);
    EXPECT_NE(receipt_of(out).payload.find("charge"), std::string::npos);
}

TEST_F(EffectExecutorTest, TooManyClaimsGivesUpWithoutCalling) {
    EXPECT_CALL(*adapter_, execute(_)).Times(0);
    std::vector<InboxDelivery> out = executor(3).execute(item(4));
    EXPECT_EQ(receipt_of(out).status, ReceiptStatus::Error);
    EXPECT_EQ(receipt_of(out).payload, "gave up after 3 claims");

    EXPECT_CALL(*adapter_, execute(_)).WillOnce(Return(result(ReceiptStatus::Ok, "paid")));
    EXPECT_EQ(receipt_of(executor(3).execute(item(3))).status, ReceiptStatus::Ok);
}

TEST(RetryPolicyTest, BackoffGrowsAndIsCapped) {
    RetryPolicy p;
    p.initial_backoff_ms = 100;
    p.multiplier = 3.0;
    p.max_backoff_ms = 1000;
    EXPECT_EQ(p.backoff_ms(1), 100u);
    EXPECT_EQ(p.backoff_ms(2), 300u);
    EXPECT_EQ(p.backoff_ms(3), 900u);
    EXPECT_EQ(p.backoff_ms(4), 1000u);
}

class DeliveryWorkerTest : public ::testing::Test {
protected:
    persist::MemoryKvStore kv_;
    ManualClock clock_;
    LeaseManager leases_{kv_, clock_, to_ns(std::chrono::milliseconds(5000))};
    Inbox inbox_{kv_};
    DeliveryQueue queue_{Pipeline::Effects, kv_, leases_, inbox_, clock_};
    AdapterRegistry registry_;
    std::shared_ptr<::testing::NiceMock<MockAdapter>> adapter_ =
        std::make_shared<::testing::NiceMock<MockAdapter>>();
    EffectExecutor executor_{registry_, RetryPolicy(), 0, [](uint64_t) {}};

    void SetUp() override {
        registry_.register_adapter("charge", adapter_);
        ON_CALL(*adapter_, execute(_)).WillByDefault(Return(result(ReceiptStatus::Ok, "paid")));
        LeaseGrant g = leases_.acquire("w", "alpha");
        ASSERT_TRUE(g.granted);
        for (int i = 0; i < 3; ++i) {
            EffectIntent intent = charge();
            intent.idempotency_key = std::to_string(i);
            ASSERT_TRUE(queue_.publish("w", g.epoch, intent));
        }
    }
};

TEST_F(DeliveryWorkerTest, RunOnceDrainsABatch) {
    DeliveryWorker worker("d1", queue_, executor_, to_ns(std::chrono::milliseconds(1000)), 2, 1);
    EXPECT_EQ(worker.run_once(), 2u);
    EXPECT_EQ(worker.run_once(), 1u);
    EXPECT_EQ(worker.run_once(), 0u);

    DeliveryStats s = worker.stats();
    EXPECT_EQ(s.claimed, 3u);
    EXPECT_EQ(s.delivered, 3u);
    EXPECT_EQ(s.claims_lost, 0u);
    EXPECT_EQ(inbox_.depth("w"), 3u);
}

TEST_F(DeliveryWorkerTest, ReapsWhatAnotherOwnerAbandoned) {
    std::vector<Claim> abandoned = queue_.claim("crashed", 0, to_ns(std::chrono::milliseconds(1000)));
    ASSERT_EQ(abandoned.size(), 3u);

    DeliveryWorker worker("d1", queue_, executor_, to_ns(std::chrono::milliseconds(1000)), 10, 1);
    EXPECT_EQ(worker.run_once(), 0u);
    clock_.advance(std::chrono::milliseconds(1000));
    EXPECT_EQ(worker.run_once(), 3u);
    EXPECT_EQ(worker.stats().reaped, 3u);
    EXPECT_EQ(inbox_.depth("w"), 3u);

    for (const auto& c : abandoned) {
        EXPECT_EQ(queue_.ack(c, {}).status, AckStatus::ClaimLost);
    }
}

TEST_F(DeliveryWorkerTest, BackgroundLoopDeliversAndStops) {
    DeliveryWorker worker("d1", queue_, executor_, to_ns(std::chrono::milliseconds(1000)), 10, 1);
    worker.start();
    EXPECT_TRUE(worker.running());
    for (int i = 0; i < 2000 && inbox_.depth("w") < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    worker.stop();
    EXPECT_FALSE(worker.running());
    EXPECT_EQ(inbox_.depth("w"), 3u);
    EXPECT_EQ(queue_.inflight_count(), 0u);
}
