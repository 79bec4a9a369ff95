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
#include <map>
#include <string>
#include <vector>

#include <matchbench/dataset/schema.h>

namespace matchbench::dataset {

/**
 * @brief key of an inserted entity with the fields dependent entities copy.
 */
struct reference_entry {
    std::int64_t id{};
    std::string code{};
};

/**
 * @brief keys of the entities already written in the current load.
 * @details an entity is populated once, right after its rows are written, and read only afterwards.
 */
class reference_index {
public:
    reference_index() = default;

    /**
     * @brief register the keys of an entity.
     * @throws dependency_error if the entity has already been populated
     */
    void populate(entity_type entity, std::vector<reference_entry> entries);

    /**
     * @brief keys of the entity in insertion order.
     * @throws dependency_error if the entity has not been populated or has no rows
     */
    [[nodiscard]] std::vector<reference_entry> const& resolve(entity_type entity) const;

    [[nodiscard]] bool contains(entity_type entity) const noexcept;

    /**
     * @brief forget every entity, called at the start of a load.
     */
    void clear() noexcept;

private:
    std::map<entity_type, std::vector<reference_entry>> entries_{};
};

}  // namespace matchbench::dataset
