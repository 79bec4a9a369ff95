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

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include <matchbench/stub/api.h>
#include <matchbench/dataset/entities.h>
#include <matchbench/dataset/schema.h>

namespace matchbench::dataset {

/**
 * @brief the columns a row type is inserted into, and how its values are bound.
 * @details bind() appends exactly columns.size() values.
 */
template <typename Row>
struct row_traits;

template <>
struct row_traits<account_row> {
    static constexpr entity_type entity = entity_type::account;
    static constexpr std::array<std::string_view, 2> columns = {"id", "name"};
    static void bind(account_row const& row, stub::parameters_type& out) {
        out.emplace_back(row.id);
        out.emplace_back(row.name);
    }
};

template <>
struct row_traits<account_group_row> {
    static constexpr entity_type entity = entity_type::account_group;
    static constexpr std::array<std::string_view, 2> columns = {"id", "name"};
    static void bind(account_group_row const& row, stub::parameters_type& out) {
        out.emplace_back(row.id);
        out.emplace_back(row.name);
    }
};

template <>
struct row_traits<account_group_link_row> {
    static constexpr entity_type entity = entity_type::account_group_link;
    static constexpr std::array<std::string_view, 2> columns = {"account_id", "account_group_id"};
    static void bind(account_group_link_row const& row, stub::parameters_type& out) {
        out.emplace_back(row.account_id);
        out.emplace_back(row.account_group_id);
    }
};

template <>
struct row_traits<skill_row> {
    static constexpr entity_type entity = entity_type::skill;
    static constexpr std::array<std::string_view, 5> columns = {"id", "code", "translation_type", "source_language", "target_language"};
    static void bind(skill_row const& row, stub::parameters_type& out) {
        out.emplace_back(row.id);
        out.emplace_back(row.code);
        out.emplace_back(std::string(to_string_view(row.type)));
        out.emplace_back(row.source_language);
        out.emplace_back(row.target_language);
    }
};

template <>
struct row_traits<account_skill_row> {
    static constexpr entity_type entity = entity_type::account_skill;
    static constexpr std::array<std::string_view, 3> columns = {"account_id", "skill_id", "skill_code"};
    static void bind(account_skill_row const& row, stub::parameters_type& out) {
        out.emplace_back(row.account_id);
        out.emplace_back(row.skill_id);
        out.emplace_back(row.skill_code);
    }
};

template <>
struct row_traits<task_row> {
    static constexpr entity_type entity = entity_type::task;
    static constexpr std::array<std::string_view, 1> columns = {"id"};
    static void bind(task_row const& row, stub::parameters_type& out) {
        out.emplace_back(row.id);
    }
};

template <>
struct row_traits<distribution_group_row> {
    static constexpr entity_type entity = entity_type::distribution_group;
    static constexpr std::array<std::string_view, 2> columns = {"id", "state"};
    static void bind(distribution_group_row const& row, stub::parameters_type& out) {
        out.emplace_back(row.id);
        out.emplace_back(std::string(to_string_view(row.state)));
    }
};

template <>
struct row_traits<distribution_group_task_row> {
    static constexpr entity_type entity = entity_type::distribution_group_task;
    static constexpr std::array<std::string_view, 3> columns = {"id", "distribution_group_id", "task_id"};
    static void bind(distribution_group_task_row const& row, stub::parameters_type& out) {
        out.emplace_back(row.id);
        out.emplace_back(row.distribution_group_id);
        out.emplace_back(row.task_id);
    }
};

template <>
struct row_traits<distribution_group_matching_row> {
    static constexpr entity_type entity = entity_type::distribution_group_matching;
    static constexpr std::array<std::string_view, 4> columns = {"id", "distribution_group_id", "pointer", "type"};
    static void bind(distribution_group_matching_row const& row, stub::parameters_type& out) {
        out.emplace_back(row.id);
        out.emplace_back(row.distribution_group_id);
        out.emplace_back(to_text(row.pointer));
        out.emplace_back(std::string(to_string_view(row.type())));
    }
};

/**
 * @brief the widest row type, in columns.
 */
static constexpr std::size_t max_columns_per_row = 5;

/**
 * @brief multi-row INSERT with positional placeholders for row_count rows.
 */
template <typename Row>
std::string insert_statement(schema_variant variant, std::size_t row_count) {
    auto const& columns = row_traits<Row>::columns;
    std::string sql{"INSERT INTO "};
    sql += table_name(row_traits<Row>::entity, variant);
    sql += " (";
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) {
            sql += ", ";
        }
        sql += columns[c];
    }
    sql += ") VALUES ";
    std::size_t placeholder = 1;
    for (std::size_t r = 0; r < row_count; ++r) {
        sql += r > 0 ? ", (" : "(";
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) {
                sql += ", ";
            }
            sql += "$";
            sql += std::to_string(placeholder++);
        }
        sql += ")";
    }
    return sql;
}

}  // namespace matchbench::dataset
