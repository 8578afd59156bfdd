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
#include "../../src/core/error.h"
#include "../../src/kernel/manifest.h"
#include "../worker/runtime_harness.h"

using namespace loom;

TEST(ManifestTest, RoutesEachEventToOneWorkflow) {
    Manifest m = test::demo_manifest();
    ASSERT_NE(m.route("note.close"), nullptr);
    EXPECT_EQ(m.route("note.close")->name, "notes");
    EXPECT_EQ(m.route("unknown"), nullptr);
    ASSERT_NE(m.find("ponger"), nullptr);
    EXPECT_TRUE(m.find("ponger")->events.empty());

    EXPECT_THROW(m.add_workflow(WorkflowDef{"notes", "other", {}}), ConfigError);
    EXPECT_THROW(m.add_workflow(WorkflowDef{"audit", "audit", {"note"}}), ConfigError);
    EXPECT_THROW(m.add_workflow(WorkflowDef{"", "audit", {}}), ConfigError);
    EXPECT_EQ(m.find("audit"), nullptr);
}

TEST(ManifestTest, EncodingIsCanonical) {
    Manifest a;
    a.add_workflow(WorkflowDef{"b", "mb", {"e2"}});
    a.add_workflow(WorkflowDef{"a", "ma", {"e1"}});
    Manifest b;
    b.add_workflow(WorkflowDef{"a", "ma", {"e1"}});
    b.add_workflow(WorkflowDef{"b", "mb", {"e2"}});
    EXPECT_EQ(a.encode(), b.encode());
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_EQ(Manifest::decode(a.encode()).hash(), a.hash());

    std::string bytes = a.encode();
    EXPECT_THROW(Manifest::decode(bytes.substr(0, bytes.size() - 1)), CorruptError);
}

TEST(ManifestTest, FromJson) {
    Manifest m = Manifest::from_json(R"({
        "workflows": [
            {"name": "orders", "module": "order", "events": ["order.placed"]},
            {"name": "ponger", "module": "ponger"}
        ]
    })");
    EXPECT_EQ(m.workflows().size(), 2u);
    EXPECT_EQ(m.route("order.placed")->module, "order");

    EXPECT_THROW(Manifest::from_json("{"), ConfigError);
    EXPECT_THROW(Manifest::from_json(R"({"flows": []})"), ConfigError);
    EXPECT_THROW(Manifest::from_json(R"({"workflows": [1]})"), ConfigError);
    EXPECT_THROW(Manifest::from_json(R"({"workflows": [{"name": "x", "module": "y", "events": [3]}]})"),
                 ConfigError);
    EXPECT_THROW(Manifest::from_json(R"({"workflows": [{"name": "x"}]})"), ConfigError);
    EXPECT_THROW(Manifest::from_json(R"({"workflows": [{"name": "x/y", "module": "m", "events": []}]})"),
                 ConfigError);
    EXPECT_THROW(Manifest::load_json_file("/nonexistent/loom-manifest.json"), ConfigError);
}
