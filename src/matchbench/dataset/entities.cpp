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
#include <matchbench/dataset/entities.h>

#include <type_traits>

namespace matchbench::dataset {

matching_type type_of(matching_pointer const& pointer) noexcept {
    switch (pointer.index()) {
    case 0: return matching_type::account_id;
    case 1: return matching_type::account_group_id;
    default: return matching_type::skill_code;
    }
}

std::string to_text(matching_pointer const& pointer) {
    return std::visit([](auto const& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, account_pointer>) {
            return std::to_string(p.account_id);
        } else if constexpr (std::is_same_v<T, account_group_pointer>) {
            return std::to_string(p.account_group_id);
        } else {
            return p.code;
        }
    }, pointer);
}

}  // namespace matchbench::dataset
