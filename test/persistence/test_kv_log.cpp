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
#include <map>
#include <stdexcept>
#include "../../src/persistence/kv_log.h"
#include "../../src/persistence/kv_checkpoint.h"
#include "../../src/persistence/durable_kv_store.h"
#include "../../src/core/error.h"
#include "test_helpers.h"

using namespace loom;
using namespace loom::persist;
using loom::persist::test::TempDir;

namespace {

std::vector<Transaction::Mutation> batch(const std::string& key, const std::string& value) {
    return {Transaction::Mutation{key, value, false}};
}

void put_one(KvStore& kv, const std::string& key, const std::string& value) {
    Transaction txn;
    txn.put(key, value);
    kv.commit(txn);
}

std::string get_or_empty(const KvStore& kv, const std::string& key) {
    std::string v;
    kv.get(key, &v);
    return v;
}

StorageConfig strict_config() {
    StorageConfig cfg;
    cfg.durability = "strict";
    return cfg;
}

// Fails the next `failures` log syncs the way a dying disk does
class FlakySyncStore : public DurableKvStore {
public:
    using DurableKvStore::DurableKvStore;
    int failures = 0;

protected:
    void sync_log_locked() override {
        if (failures > 0) {
            --failures;
            throw std::runtime_error("KvLog: fdatasync failed: Input/output error");
        }
        DurableKvStore::sync_log_locked();
    }
};

}

class KvLogTest : public ::testing::Test {
protected:
    TempDir dir_{"loom_kvlog"};

    std::string write_frames(int n) {
        std::string path = dir_.file("test.wal");
        KvLog log(path, 1);
        EXPECT_TRUE(log.open_for_append());
        for (int i = 1; i <= n; ++i) {
            log.append(i, batch("k" + std::to_string(i), "v" + std::to_string(i)));
        }
        log.sync();
        log.close();
        return path;
    }
};

TEST_F(KvLogTest, ReplayReturnsFramesInOrder) {
    std::string path = write_frames(3);

    std::vector<uint64_t> seqs;
    uint64_t last_good = 0;
    std::string err;
    ASSERT_TRUE(KvLog::replay(path, [&](uint64_t seq, const std::vector<Transaction::Mutation>& m) {
        seqs.push_back(seq);
        ASSERT_EQ(m.size(), 1u);
        EXPECT_EQ(m[0].key, "k" + std::to_string(seq));
    }, &last_good, &err));

    EXPECT_EQ(seqs, (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(last_good, test::file_size(path));
}

TEST_F(KvLogTest, TornTailStopsAtLastCompleteFrame) {
    std::string path = write_frames(3);
    const size_t full = test::file_size(path);
    test::truncate_file(path, full - 3);

    size_t frames = 0;
    uint64_t last_good = 0;
    std::string err;
    EXPECT_TRUE(KvLog::replay(path, [&](uint64_t, const std::vector<Transaction::Mutation>&) { ++frames; },
                              &last_good, &err));
    EXPECT_EQ(frames, 2u);
    EXPECT_LT(last_good, full - 3);
}

TEST_F(KvLogTest, PayloadCorruptionIsReported) {
    std::string path = write_frames(2);
    // Second byte of the first payload (header is 16 bytes)
    test::corrupt_file(path, 17, 1);

    size_t frames = 0;
    uint64_t last_good = 99;
    std::string err;
    EXPECT_FALSE(KvLog::replay(path, [&](uint64_t, const std::vector<Transaction::Mutation>&) { ++frames; },
                               &last_good, &err));
    EXPECT_EQ(frames, 0u);
    EXPECT_EQ(last_good, 0u);
    EXPECT_FALSE(err.empty());
}

TEST_F(KvLogTest, CheckpointRoundTripAndChecksum) {
    std::map<std::string, std::string> table{{"a", "1"}, {"b", std::string("\0\1\2", 3)}};
    std::string path = dir_.file(KvCheckpoint::file_name(42));
    auto w = KvCheckpoint::write(path, table, 42);
    ASSERT_TRUE(w.ok) << w.error;
    EXPECT_EQ(w.entries, 2u);

    std::map<std::string, std::string> loaded;
    auto r = KvCheckpoint::load(path, [&](const std::string& k, const std::string& v) { loaded[k] = v; });
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.commit_seq, 42u);
    EXPECT_EQ(r.crc32c, w.crc32c);
    EXPECT_EQ(loaded, table);

    test::corrupt_file(path, 30, 2);
    loaded.clear();
    auto bad = KvCheckpoint::load(path, [&](const std::string& k, const std::string& v) { loaded[k] = v; });
    EXPECT_FALSE(bad.ok);
    EXPECT_TRUE(loaded.empty());
}

class DurableKvStoreTest : public ::testing::Test {
protected:
    TempDir dir_{"loom_durable_kv"};
};

TEST_F(DurableKvStoreTest, CommitsSurviveReopen) {
    {
        DurableKvStore kv(dir_.path(), strict_config());
        kv.open();
        put_one(kv, "world/a/head", "3");
        put_one(kv, "world/b/head", "7");

        Transaction txn;
        txn.erase("world/b/head");
        txn.put("world/c/head", "1");
        kv.commit(txn);
        EXPECT_EQ(kv.last_commit_seq(), 3u);
    }

    DurableKvStore kv(dir_.path(), strict_config());
    kv.open();
    EXPECT_EQ(kv.last_commit_seq(), 3u);
    EXPECT_EQ(kv.recovery_stats().frames_replayed, 3u);
    EXPECT_EQ(get_or_empty(kv, "world/a/head"), "3");
    EXPECT_FALSE(kv.get("world/b/head", nullptr));
    EXPECT_EQ(get_or_empty(kv, "world/c/head"), "1");
}

TEST_F(DurableKvStoreTest, RejectedCommitIsNotLogged) {
    {
        DurableKvStore kv(dir_.path(), strict_config());
        kv.open();
        put_one(kv, "k", "1");

        Transaction txn;
        txn.expect_absent("k");
        txn.put("k", "2");
        EXPECT_THROW(kv.commit(txn), CommitConflictError);
    }

    DurableKvStore kv(dir_.path(), strict_config());
    kv.open();
    EXPECT_EQ(kv.last_commit_seq(), 1u);
    EXPECT_EQ(get_or_empty(kv, "k"), "1");
}

TEST_F(DurableKvStoreTest, TornTailIsTruncatedOnOpen) {
    {
        DurableKvStore kv(dir_.path(), strict_config());
        kv.open();
        for (int i = 0; i < 4; ++i) put_one(kv, "k" + std::to_string(i), "v");
    }

    auto logs = loom::persist::test::files_with_extension(dir_.path(), ".wal");
    ASSERT_EQ(logs.size(), 1u);
    test::truncate_file(logs[0], test::file_size(logs[0]) - 2);

    {
        DurableKvStore kv(dir_.path(), strict_config());
        kv.open();
        EXPECT_EQ(kv.last_commit_seq(), 3u);
        EXPECT_GT(kv.recovery_stats().truncated_bytes, 0u);
        EXPECT_FALSE(kv.get("k3", nullptr));

        // New commits land after the truncation point
        put_one(kv, "after", "x");
    }

    DurableKvStore kv(dir_.path(), strict_config());
    kv.open();
    EXPECT_EQ(kv.last_commit_seq(), 4u);
    EXPECT_EQ(get_or_empty(kv, "after"), "x");
}

TEST_F(DurableKvStoreTest, CheckpointBoundsReplay) {
    StorageConfig cfg = strict_config();
    cfg.checkpoint_every_commits = 5;
    {
        DurableKvStore kv(dir_.path(), cfg);
        kv.open();
        for (int i = 0; i < 12; ++i) put_one(kv, "k" + std::to_string(i), std::to_string(i));
    }

    DurableKvStore kv(dir_.path(), cfg);
    kv.open();
    EXPECT_EQ(kv.last_commit_seq(), 12u);
    EXPECT_EQ(kv.recovery_stats().checkpoint_commit, 10u);
    EXPECT_EQ(kv.recovery_stats().frames_replayed, 2u);
    EXPECT_EQ(kv.size(), 12u);
    EXPECT_LE(loom::persist::test::files_with_extension(dir_.path(), ".ckpt").size(), cfg.checkpoint_keep_count);
}

TEST_F(DurableKvStoreTest, CorruptCheckpointFailsOpen) {
    {
        DurableKvStore kv(dir_.path(), strict_config());
        kv.open();
        put_one(kv, "a", "1");
        put_one(kv, "b", "2");
        ASSERT_TRUE(kv.checkpoint());
    }

    auto ckpts = loom::persist::test::files_with_extension(dir_.path(), ".ckpt");
    ASSERT_EQ(ckpts.size(), 1u);
    test::corrupt_file(ckpts[0], 30, 4);

    DurableKvStore kv(dir_.path(), strict_config());
    EXPECT_THROW(kv.open(), CorruptError);
}

TEST_F(DurableKvStoreTest, FailedSyncLeavesNoCommitBehind) {
    {
        FlakySyncStore kv(dir_.path(), strict_config());
        kv.open();
        put_one(kv, "lease/w", "epoch-1");

        kv.failures = 1;
        EXPECT_THROW(put_one(kv, "lease/w", "epoch-2"), std::runtime_error);
        EXPECT_EQ(get_or_empty(kv, "lease/w"), "epoch-1");
        EXPECT_EQ(kv.last_commit_seq(), 1u);

        put_one(kv, "world/w/head", "1");
        EXPECT_EQ(kv.last_commit_seq(), 2u);
    }

    DurableKvStore kv(dir_.path(), strict_config());
    kv.open();
    EXPECT_EQ(kv.last_commit_seq(), 2u);
    EXPECT_EQ(kv.recovery_stats().frames_replayed, 2u);
    EXPECT_EQ(get_or_empty(kv, "lease/w"), "epoch-1");
    EXPECT_EQ(get_or_empty(kv, "world/w/head"), "1");
}

TEST_F(DurableKvStoreTest, FailedCheckpointSyncKeepsTheCommit) {
    StorageConfig cfg;
    cfg.durability = "eventual";
    cfg.checkpoint_every_commits = 1;
    {
        FlakySyncStore kv(dir_.path(), cfg);
        kv.open();

        kv.failures = 1;
        EXPECT_NO_THROW(put_one(kv, "lease/w", "epoch-1"));
        EXPECT_EQ(get_or_empty(kv, "lease/w"), "epoch-1");
        EXPECT_EQ(kv.last_commit_seq(), 1u);
        EXPECT_TRUE(loom::persist::test::files_with_extension(dir_.path(), ".ckpt").empty());

        EXPECT_TRUE(kv.checkpoint());
        EXPECT_EQ(loom::persist::test::files_with_extension(dir_.path(), ".ckpt").size(), 1u);
    }

    DurableKvStore kv(dir_.path(), cfg);
    kv.open();
    EXPECT_EQ(get_or_empty(kv, "lease/w"), "epoch-1");
}

TEST_F(DurableKvStoreTest, InvalidConfigIsRejected) {
    StorageConfig cfg;
    cfg.durability = "sometimes";
    EXPECT_THROW(DurableKvStore(dir_.path(), cfg), ConfigError);
}
