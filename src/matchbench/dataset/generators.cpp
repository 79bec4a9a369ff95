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
#include <matchbench/dataset/generators.h>

#include <algorithm>
#include <string>

#include <matchbench/exception.h>

namespace matchbench::dataset {

namespace {

std::int64_t to_id(std::size_t index) {
    return static_cast<std::int64_t>(index) + 1;
}

}  // namespace

account_row generate_account(std::size_t index) {
    auto id = to_id(index);
    return account_row{id, "Account_" + std::to_string(id)};
}

account_group_row generate_account_group(std::size_t index) {
    auto id = to_id(index);
    return account_group_row{id, "Group_" + std::to_string(id)};
}

task_row generate_task(std::size_t index) {
    return task_row{to_id(index)};
}

distribution_group_row generate_distribution_group(std::size_t index) {
    return distribution_group_row{to_id(index), distribution_group_state::waiting};
}

skill_row generate_skill(std::size_t index) {
    if (index >= max_skill_count()) {
        throw configuration_error("only " + std::to_string(max_skill_count()) + " distinct skill codes exist, requested skill #" + std::to_string(index + 1));
    }
    // source-major, a source language is paired with every other language in list order
    auto const targets = languages.size() - 1;
    auto source = index / targets;
    auto target = index % targets;
    if (target >= source) {
        ++target;
    }
    skill_row row{};
    row.id = to_id(index);
    row.source_language = std::string(languages.at(source));
    row.target_language = std::string(languages.at(target));
    row.code = "SKILL_" + row.source_language + "_" + row.target_language;
    row.type = translation_type::subtitle;
    return row;
}

std::vector<account_group_link_row> generate_account_group_links(
    std::size_t index, reference_index const& references, random_generator& rnd) {
    auto const& accounts = references.resolve(entity_type::account);
    auto const& groups = references.resolve(entity_type::account_group);
    auto const& account = accounts.at(index);

    auto upper = std::min(max_account_groups_per_account, groups.size());
    auto count = rnd.uniform_within(1, upper);
    std::vector<account_group_link_row> rows{};
    rows.reserve(count);
    for (auto position : rnd.choose_distinct(groups.size(), count)) {
        rows.emplace_back(account_group_link_row{account.id, groups[position].id});
    }
    return rows;
}

std::vector<account_skill_row> generate_account_skills(
    std::size_t index, reference_index const& references, random_generator& rnd) {
    auto const& accounts = references.resolve(entity_type::account);
    auto const& skills = references.resolve(entity_type::skill);
    auto const& account = accounts.at(index);

    auto upper = std::min(max_skills_per_account, skills.size());
    auto count = rnd.uniform_within(1, upper);
    std::vector<account_skill_row> rows{};
    rows.reserve(count);
    for (auto position : rnd.choose_distinct(skills.size(), count)) {
        auto const& skill = skills[position];
        rows.emplace_back(account_skill_row{account.id, skill.id, skill.code});
    }
    return rows;
}

distribution_group_task_row generate_distribution_group_task(std::size_t index) {
    auto id = to_id(index);
    return distribution_group_task_row{id, id, id};
}

matching_type matching_type_for(std::int64_t distribution_group_id) noexcept {
    switch ((distribution_group_id - 1) % 3) {
    case 0: return matching_type::account_id;
    case 1: return matching_type::account_group_id;
    default: return matching_type::skill_code;
    }
}

distribution_group_matching_row generate_distribution_group_matching(
    std::size_t index, reference_index const& references) {
    distribution_group_matching_row row{};
    row.id = to_id(index);
    row.distribution_group_id = row.id;

    auto dg_id = static_cast<std::size_t>(row.distribution_group_id);
    switch (matching_type_for(row.distribution_group_id)) {
    case matching_type::account_id: {
        auto const& accounts = references.resolve(entity_type::account);
        row.pointer = account_pointer{accounts[dg_id % accounts.size()].id};
        break;
    }
    case matching_type::account_group_id: {
        auto const& groups = references.resolve(entity_type::account_group);
        row.pointer = account_group_pointer{groups[dg_id % groups.size()].id};
        break;
    }
    case matching_type::skill_code: {
        auto const& skills = references.resolve(entity_type::skill);
        row.pointer = skill_code_pointer{skills[dg_id % skills.size()].code};
        break;
    }
    }
    return row;
}

}  // namespace matchbench::dataset
