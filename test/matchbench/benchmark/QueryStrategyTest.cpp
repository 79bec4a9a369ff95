/*
 * Copyright 2025-2026 matchbench project.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include <gtest/gtest.h>

#include <matchbench/exception.h>
#include <matchbench/benchmark/query_strategy.h>

namespace matchbench::testing {

using namespace matchbench::benchmark;
using dataset::schema_variant;

class QueryStrategyTest : public ::testing::Test {};

TEST_F(QueryStrategyTest, outer_join_and_group) {
    EXPECT_EQ("SELECT dg.id, dg.state FROM distribution_group dg"
              " JOIN distribution_group_matching dgm ON dgm.distribution_group_id = dg.id"
              " LEFT JOIN skill s ON dgm.type = 'SKILL_CODE' AND dgm.pointer = s.code"
              " LEFT JOIN account a ON dgm.type = 'ACCOUNT_ID' AND dgm.pointer = CAST(a.id AS TEXT)"
              " LEFT JOIN account_group ag ON dgm.type = 'ACCOUNT_GROUP_ID' AND dgm.pointer = CAST(ag.id AS TEXT)"
              " WHERE dg.state = 'WAITING' AND (s.id IS NOT NULL OR a.id IS NOT NULL OR ag.id IS NOT NULL)"
              " GROUP BY dg.id, dg.state"
              " ORDER BY dg.id LIMIT $1 OFFSET $2",
              render_query(query_shape::outer_join_and_group, schema_variant::base));
}

TEST_F(QueryStrategyTest, union_of_inner_joins) {
    auto sql = render_query(query_shape::union_of_inner_joins, schema_variant::base);
    EXPECT_EQ(0U, sql.find("SELECT dg.id, dg.state FROM distribution_group dg JOIN distribution_group_matching dgm"
                           " ON dgm.distribution_group_id = dg.id JOIN skill s ON dgm.type = 'SKILL_CODE' AND dgm.pointer = s.code"
                           " WHERE dg.state = 'WAITING' UNION ALL "));
    EXPECT_NE(std::string::npos, sql.find(" JOIN account a ON dgm.type = 'ACCOUNT_ID' AND dgm.pointer = CAST(a.id AS TEXT)"));
    EXPECT_NE(std::string::npos, sql.find(" JOIN account_group ag ON dgm.type = 'ACCOUNT_GROUP_ID' AND dgm.pointer = CAST(ag.id AS TEXT)"));
    std::string tail{" ORDER BY id LIMIT $1 OFFSET $2"};
    EXPECT_EQ(sql.size() - tail.size(), sql.rfind(tail));
    EXPECT_EQ(std::string::npos, sql.find("LEFT JOIN"));
}

TEST_F(QueryStrategyTest, variants_differ_only_in_table_suffix) {
    for (auto shape : {query_shape::outer_join_and_group, query_shape::union_of_inner_joins}) {
        auto base = render_query(shape, schema_variant::base);
        auto indexed = render_query(shape, schema_variant::shadow);
        for (auto table : {"distribution_group_matching", "distribution_group", "account_group", "account", "skill"}) {
            std::string from{std::string(" ") + table + " "};
            std::string to{std::string(" ") + table + "_2 "};
            for (auto pos = base.find(from); pos != std::string::npos; pos = base.find(from, pos + to.size())) {
                base.replace(pos, from.size(), to);
            }
        }
        EXPECT_EQ(base, indexed);
    }
}

TEST_F(QueryStrategyTest, default_strategies) {
    auto const& strategies = default_strategies();
    ASSERT_EQ(4U, strategies.size());
    EXPECT_EQ("left-join", strategies[0].name);
    EXPECT_EQ(query_shape::outer_join_and_group, strategies[0].shape);
    EXPECT_EQ(schema_variant::base, strategies[0].variant);
    EXPECT_EQ("union-all", strategies[1].name);
    EXPECT_EQ("left-join-indexed", strategies[2].name);
    EXPECT_EQ(schema_variant::shadow, strategies[2].variant);
    EXPECT_EQ("union-all-indexed", strategies[3].name);
    EXPECT_EQ(query_shape::union_of_inner_joins, strategies[3].shape);
    EXPECT_NE(std::string::npos, strategies[3].sql().find("distribution_group_matching_2"));
}

TEST_F(QueryStrategyTest, parse_strategies) {
    auto strategies = parse_strategies("union-all-indexed, left-join");
    ASSERT_EQ(2U, strategies.size());
    EXPECT_EQ("union-all-indexed", strategies[0].name);
    EXPECT_EQ("left-join", strategies[1].name);

    EXPECT_THROW(parse_strategies(""), configuration_error);
    EXPECT_THROW(parse_strategies("left-join,nested-loop"), configuration_error);
    EXPECT_THROW(parse_strategies("left-join,left-join"), configuration_error);
    EXPECT_FALSE(find_strategy("nested-loop"));
}

}  // namespace matchbench::testing
