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
#include <matchbench/dataset/load_config.h>

#include <string>

#include <matchbench/exception.h>
#include <matchbench/dataset/generators.h>
#include <matchbench/dataset/row_traits.h>

namespace matchbench::dataset {

namespace {

void require_positive(std::size_t value, std::string_view name) {
    if (value == 0) {
        throw configuration_error(std::string(name) + " must be greater than 0");
    }
}

}  // namespace

std::size_t max_batch_size() noexcept {
    // a batch is closed after the index that fills it, which adds at most max_skills_per_account - 1 rows
    return max_bind_parameters / max_columns_per_row - (max_skills_per_account - 1);
}

void load_config::validate() const {
    require_positive(account_count, "account_count");
    require_positive(account_group_count, "account_group_count");
    require_positive(skill_count, "skill_count");
    require_positive(distribution_group_count, "distribution_group_count");
    require_positive(batch_size, "batch_size");
    require_positive(progress_interval, "progress_interval");
    if (skill_count > max_skill_count()) {
        throw configuration_error("skill_count " + std::to_string(skill_count) + " exceeds the " +
                                  std::to_string(max_skill_count()) + " distinct skill codes");
    }
    if (batch_size > max_batch_size()) {
        throw configuration_error("batch_size " + std::to_string(batch_size) + " exceeds " + std::to_string(max_batch_size()) +
                                  ", a batch would need more than " + std::to_string(max_bind_parameters) + " bind parameters");
    }
    if (schemas.empty()) {
        throw configuration_error("no schema selected");
    }
}

std::vector<schema_variant> parse_schemas(std::string_view value) {
    if (value == "base") {
        return {schema_variant::base};
    }
    if (value == "shadow") {
        return {schema_variant::shadow};
    }
    if (value == "both") {
        return {schema_variant::base, schema_variant::shadow};
    }
    throw configuration_error("unknown schemas '" + std::string(value) + "', expected base, shadow or both");
}

}  // namespace matchbench::dataset
