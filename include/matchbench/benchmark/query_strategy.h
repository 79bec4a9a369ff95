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
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <matchbench/dataset/schema.h>

namespace matchbench::benchmark {

/**
 * @brief the SQL access pattern of a strategy.
 */
enum class query_shape {
    // one query, outer joins on the discriminated pointer and grouping
    outer_join_and_group,
    // one inner join per matching type, concatenated
    union_of_inner_joins,
};

constexpr std::string_view to_string_view(query_shape value) noexcept {
    switch (value) {
    case query_shape::outer_join_and_group: return "outer-join-and-group";
    case query_shape::union_of_inner_joins: return "union-of-inner-joins";
    }
    return "unknown";
}

/**
 * @brief the query returning a page of WAITING distribution groups that have a resolvable matching.
 * @details $1 is bound to the page size and $2 to the offset.
 */
std::string render_query(query_shape shape, dataset::schema_variant variant);

/**
 * @brief a named query shape run against one schema variant.
 */
struct query_strategy {
    std::string name{};
    query_shape shape{query_shape::outer_join_and_group};
    dataset::schema_variant variant{dataset::schema_variant::base};

    [[nodiscard]] std::string sql() const { return render_query(shape, variant); }
};

/**
 * @brief left-join, union-all, left-join-indexed and union-all-indexed, in this order.
 */
std::vector<query_strategy> const& default_strategies();

std::optional<query_strategy> find_strategy(std::string_view name);

/**
 * @brief strategies named in a comma separated list, in list order.
 * @throws configuration_error for an empty list, an unknown or a repeated name
 */
std::vector<query_strategy> parse_strategies(std::string_view list);

}  // namespace matchbench::benchmark
