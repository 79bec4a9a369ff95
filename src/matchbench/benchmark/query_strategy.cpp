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
#include <matchbench/benchmark/query_strategy.h>

#include <algorithm>
#include <utility>

#include <boost/algorithm/string.hpp>

#include <matchbench/exception.h>

namespace matchbench::benchmark {

using dataset::entity_type;
using dataset::schema_variant;
using dataset::table_name;

namespace {

std::string outer_join_and_group(schema_variant variant) {
    auto dg = table_name(entity_type::distribution_group, variant);
    auto dgm = table_name(entity_type::distribution_group_matching, variant);
    auto skill = table_name(entity_type::skill, variant);
    auto account = table_name(entity_type::account, variant);
    auto group = table_name(entity_type::account_group, variant);

    return "SELECT dg.id, dg.state FROM " + dg + " dg"
           " JOIN " + dgm + " dgm ON dgm.distribution_group_id = dg.id"
           " LEFT JOIN " + skill + " s ON dgm.type = 'SKILL_CODE' AND dgm.pointer = s.code"
           " LEFT JOIN " + account + " a ON dgm.type = 'ACCOUNT_ID' AND dgm.pointer = CAST(a.id AS TEXT)"
           " LEFT JOIN " + group + " ag ON dgm.type = 'ACCOUNT_GROUP_ID' AND dgm.pointer = CAST(ag.id AS TEXT)"
           " WHERE dg.state = 'WAITING' AND (s.id IS NOT NULL OR a.id IS NOT NULL OR ag.id IS NOT NULL)"
           " GROUP BY dg.id, dg.state"
           " ORDER BY dg.id LIMIT $1 OFFSET $2";
}

std::string union_of_inner_joins(schema_variant variant) {
    auto dg = table_name(entity_type::distribution_group, variant);
    auto dgm = table_name(entity_type::distribution_group_matching, variant);
    auto skill = table_name(entity_type::skill, variant);
    auto account = table_name(entity_type::account, variant);
    auto group = table_name(entity_type::account_group, variant);
    auto head = "SELECT dg.id, dg.state FROM " + dg + " dg JOIN " + dgm + " dgm ON dgm.distribution_group_id = dg.id";

    return head + " JOIN " + skill + " s ON dgm.type = 'SKILL_CODE' AND dgm.pointer = s.code"
                  " WHERE dg.state = 'WAITING'"
           " UNION ALL " +
           head + " JOIN " + account + " a ON dgm.type = 'ACCOUNT_ID' AND dgm.pointer = CAST(a.id AS TEXT)"
                  " WHERE dg.state = 'WAITING'"
           " UNION ALL " +
           head + " JOIN " + group + " ag ON dgm.type = 'ACCOUNT_GROUP_ID' AND dgm.pointer = CAST(ag.id AS TEXT)"
                  " WHERE dg.state = 'WAITING'"
           " ORDER BY id LIMIT $1 OFFSET $2";
}

}  // namespace

std::string render_query(query_shape shape, schema_variant variant) {
    switch (shape) {
    case query_shape::outer_join_and_group: return outer_join_and_group(variant);
    case query_shape::union_of_inner_joins: return union_of_inner_joins(variant);
    }
    return {};
}

std::vector<query_strategy> const& default_strategies() {
    static const std::vector<query_strategy> strategies = {
        {"left-join", query_shape::outer_join_and_group, schema_variant::base},
        {"union-all", query_shape::union_of_inner_joins, schema_variant::base},
        {"left-join-indexed", query_shape::outer_join_and_group, schema_variant::shadow},
        {"union-all-indexed", query_shape::union_of_inner_joins, schema_variant::shadow},
    };
    return strategies;
}

std::optional<query_strategy> find_strategy(std::string_view name) {
    for (auto const& s : default_strategies()) {
        if (s.name == name) {
            return s;
        }
    }
    return std::nullopt;
}

std::vector<query_strategy> parse_strategies(std::string_view list) {
    std::vector<std::string> names{};
    std::string text{list};
    boost::algorithm::split(names, text, boost::is_any_of(","));

    std::vector<query_strategy> strategies{};
    for (auto& name : names) {
        boost::algorithm::trim(name);
        if (name.empty()) {
            continue;
        }
        auto strategy = find_strategy(name);
        if (!strategy) {
            throw configuration_error("unknown strategy '" + name + "'");
        }
        if (std::any_of(strategies.begin(), strategies.end(), [&name](auto const& s) { return s.name == name; })) {
            throw configuration_error("strategy '" + name + "' is given twice");
        }
        strategies.emplace_back(std::move(*strategy));
    }
    if (strategies.empty()) {
        throw configuration_error("no strategy selected");
    }
    return strategies;
}

}  // namespace matchbench::benchmark
