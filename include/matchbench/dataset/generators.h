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
#include <cstdint>
#include <string_view>
#include <vector>

#include <matchbench/dataset/entities.h>
#include <matchbench/dataset/random.h>
#include <matchbench/dataset/reference_index.h>

namespace matchbench::dataset {

/**
 * @brief the languages skills translate between, in the order skill codes are enumerated.
 */
static constexpr std::array<std::string_view, 10> languages = {
    "EN", "KO", "JA", "ZH", "ES", "FR", "DE", "PT", "IT", "RU",
};

static constexpr std::size_t max_account_groups_per_account = 3;
static constexpr std::size_t max_skills_per_account = 5;

/**
 * @brief the number of distinct skill codes, every ordered pair of different languages.
 */
constexpr std::size_t max_skill_count() noexcept {
    return languages.size() * (languages.size() - 1);
}

// independent entities, a pure function of the row index
account_row generate_account(std::size_t index);
account_group_row generate_account_group(std::size_t index);
task_row generate_task(std::size_t index);
distribution_group_row generate_distribution_group(std::size_t index);

/**
 * @brief the skill at the position of the source-major enumeration of language pairs.
 * @throws configuration_error if index is not less than max_skill_count()
 */
skill_row generate_skill(std::size_t index);

/**
 * @brief links the account at the index of the account keys to 1 to 3 distinct groups.
 * @throws dependency_error if accounts or account groups have not been loaded
 */
std::vector<account_group_link_row> generate_account_group_links(
    std::size_t index, reference_index const& references, random_generator& rnd);

/**
 * @brief gives the account at the index of the account keys 1 to 5 distinct skills.
 * @throws dependency_error if accounts or skills have not been loaded
 */
std::vector<account_skill_row> generate_account_skills(
    std::size_t index, reference_index const& references, random_generator& rnd);

/**
 * @brief links distribution group index + 1 to task index + 1.
 */
distribution_group_task_row generate_distribution_group_task(std::size_t index);

/**
 * @brief the matching type of a distribution group, cycling ACCOUNT_ID, ACCOUNT_GROUP_ID, SKILL_CODE.
 */
matching_type matching_type_for(std::int64_t distribution_group_id) noexcept;

/**
 * @brief the matching of distribution group index + 1.
 * @details the target is picked deterministically from the distribution group id.
 * @throws dependency_error if the referenced entity has not been loaded
 */
distribution_group_matching_row generate_distribution_group_matching(
    std::size_t index, reference_index const& references);

}  // namespace matchbench::dataset
