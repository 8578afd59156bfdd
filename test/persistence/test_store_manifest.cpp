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
#include "../../src/persistence/store_manifest.h"
#include "test_helpers.h"

using namespace loom::persist;
using loom::persist::test::TempDir;

class StoreManifestTest : public ::testing::Test {
protected:
    TempDir dir_{"loom_manifest"};

    StoreManifest sample() {
        StoreManifest mf(dir_.path());
        StoreManifest::CheckpointInfo ckpt;
        ckpt.path = "kv-00000000000000000010.ckpt";
        ckpt.commit_seq = 10;
        ckpt.entries = 7;
        ckpt.crc32c = 0xdeadbeef;
        mf.set_checkpoint(ckpt);
        mf.add_log(StoreManifest::LogInfo{"kv-00000000000000000002.wal", 2, 6});
        mf.add_log(StoreManifest::LogInfo{"kv-00000000000000000003.wal", 3, 11});
        return mf;
    }
};

TEST_F(StoreManifestTest, StoreAndLoad) {
    StoreManifest written = sample();
    ASSERT_TRUE(written.store());

    StoreManifest mf(dir_.path());
    ASSERT_TRUE(mf.load());
    EXPECT_EQ(mf.checkpoint().path, "kv-00000000000000000010.ckpt");
    EXPECT_EQ(mf.checkpoint().commit_seq, 10u);
    EXPECT_EQ(mf.checkpoint().entries, 7u);
    EXPECT_EQ(mf.checkpoint().crc32c, 0xdeadbeefu);
    ASSERT_EQ(mf.logs().size(), 2u);
    EXPECT_EQ(mf.logs()[1].sequence, 3u);
    EXPECT_EQ(mf.logs()[1].start_commit, 11u);
}

TEST_F(StoreManifestTest, MissingOrGarbageDoesNotLoad) {
    StoreManifest mf(dir_.path());
    EXPECT_FALSE(mf.load());
    EXPECT_FALSE(mf.from_json("{ not json"));
}

TEST_F(StoreManifestTest, PruneKeepsLogsPastTheCheckpoint) {
    StoreManifest mf = sample();
    mf.prune_logs_before(10);
    ASSERT_EQ(mf.logs().size(), 1u);
    EXPECT_EQ(mf.logs()[0].sequence, 3u);

    // The newest log is never pruned, even when fully covered
    mf.prune_logs_before(100);
    EXPECT_EQ(mf.logs().size(), 1u);
}
