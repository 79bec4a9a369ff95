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

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace matchbench::dataset {

enum class distribution_group_state {
    waiting,
    assigned,
    done,
};

enum class matching_type {
    account_id,
    account_group_id,
    skill_code,
};

enum class translation_type {
    subtitle,
};

constexpr std::string_view to_string_view(distribution_group_state value) noexcept {
    switch (value) {
    case distribution_group_state::waiting: return "WAITING";
    case distribution_group_state::assigned: return "ASSIGNED";
    case distribution_group_state::done: return "DONE";
    }
    return "UNKNOWN";
}

constexpr std::string_view to_string_view(matching_type value) noexcept {
    switch (value) {
    case matching_type::account_id: return "ACCOUNT_ID";
    case matching_type::account_group_id: return "ACCOUNT_GROUP_ID";
    case matching_type::skill_code: return "SKILL_CODE";
    }
    return "UNKNOWN";
}

constexpr std::string_view to_string_view(translation_type value) noexcept {
    switch (value) {
    case translation_type::subtitle: return "SUBTITLE";
    }
    return "UNKNOWN";
}

struct account_row {
    std::int64_t id{};
    std::string name{};
};

struct account_group_row {
    std::int64_t id{};
    std::string name{};
};

/**
 * @brief membership of an account in a group, the id is assigned by the store.
 */
struct account_group_link_row {
    std::int64_t account_id{};
    std::int64_t account_group_id{};
};

struct skill_row {
    std::int64_t id{};
    std::string code{};
    translation_type type{translation_type::subtitle};
    std::string source_language{};
    std::string target_language{};
};

/**
 * @brief skill of an account, the id is assigned by the store.
 * @details skill_code is a copy of the code of the referenced skill.
 */
struct account_skill_row {
    std::int64_t account_id{};
    std::int64_t skill_id{};
    std::string skill_code{};
};

struct task_row {
    std::int64_t id{};
};

struct distribution_group_row {
    std::int64_t id{};
    distribution_group_state state{distribution_group_state::waiting};
};

struct distribution_group_task_row {
    std::int64_t id{};
    std::int64_t distribution_group_id{};
    std::int64_t task_id{};
};

// targets of a distribution group matching
struct account_pointer {
    std::int64_t account_id{};
};
struct account_group_pointer {
    std::int64_t account_group_id{};
};
struct skill_code_pointer {
    std::string code{};
};

/**
 * @brief polymorphic reference of a matching, the alternative decides the matching type.
 */
using matching_pointer = std::variant<account_pointer, account_group_pointer, skill_code_pointer>;

/**
 * @brief the matching type the pointer stands for.
 */
matching_type type_of(matching_pointer const& pointer) noexcept;

/**
 * @brief the text stored in the pointer column.
 */
std::string to_text(matching_pointer const& pointer);

struct distribution_group_matching_row {
    std::int64_t id{};
    std::int64_t distribution_group_id{};
    matching_pointer pointer{};

    [[nodiscard]] matching_type type() const noexcept { return type_of(pointer); }
};

}  // namespace matchbench::dataset
