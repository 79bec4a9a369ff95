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

namespace matchbench::dataset {

/**
 * @brief the tables of the entity graph.
 */
enum class entity_type {
    account,
    account_group,
    account_group_link,
    skill,
    account_skill,
    task,
    distribution_group,
    distribution_group_task,
    distribution_group_matching,
};

/**
 * @brief the schema a table belongs to.
 * @details the shadow schema holds the same content as the base schema plus supplementary indexes.
 */
enum class schema_variant {
    base,
    shadow,
};

/**
 * @brief entities in the order they are written, independent entities first.
 */
static constexpr std::array<entity_type, 9> load_order = {
    entity_type::account,
    entity_type::account_group,
    entity_type::skill,
    entity_type::task,
    entity_type::distribution_group,
    entity_type::account_group_link,
    entity_type::account_skill,
    entity_type::distribution_group_task,
    entity_type::distribution_group_matching,
};

/**
 * @brief entities in reverse foreign-key dependency order, referencing tables first.
 */
static constexpr std::array<entity_type, 9> truncate_order = {
    entity_type::distribution_group_matching,
    entity_type::distribution_group_task,
    entity_type::distribution_group,
    entity_type::task,
    entity_type::account_skill,
    entity_type::account_group_link,
    entity_type::skill,
    entity_type::account_group,
    entity_type::account,
};

constexpr std::string_view to_string_view(entity_type value) noexcept {
    switch (value) {
    case entity_type::account: return "account";
    case entity_type::account_group: return "account_group";
    case entity_type::account_group_link: return "account_to_account_group";
    case entity_type::skill: return "skill";
    case entity_type::account_skill: return "account_skill";
    case entity_type::task: return "task";
    case entity_type::distribution_group: return "distribution_group";
    case entity_type::distribution_group_task: return "distribution_group_task";
    case entity_type::distribution_group_matching: return "distribution_group_matching";
    }
    return "unknown";
}

constexpr std::string_view to_string_view(schema_variant value) noexcept {
    switch (value) {
    case schema_variant::base: return "base";
    case schema_variant::shadow: return "shadow";
    }
    return "unknown";
}

/**
 * @brief suffix appended to every table name of the variant.
 */
constexpr std::string_view table_suffix(schema_variant value) noexcept {
    return value == schema_variant::shadow ? "_2" : "";
}

/**
 * @brief qualified table name of the entity in the given schema variant.
 */
inline std::string table_name(entity_type entity, schema_variant variant) {
    std::string name{to_string_view(entity)};
    name += table_suffix(variant);
    return name;
}

}  // namespace matchbench::dataset
