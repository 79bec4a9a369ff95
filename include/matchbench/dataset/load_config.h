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

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <matchbench/dataset/schema.h>

namespace matchbench::dataset {

/**
 * @brief the number of bind parameters a single statement can carry.
 */
static constexpr std::size_t max_bind_parameters = 65535;

/**
 * @brief seed of the random source unless another one is configured.
 */
static constexpr std::uint64_t default_seed = 20240601;

/**
 * @brief cardinalities and write parameters of a dataset load.
 */
struct load_config {
    std::size_t account_count{100};
    std::size_t account_group_count{20};
    std::size_t skill_count{50};
    // also the number of tasks
    std::size_t distribution_group_count{1000000};
    std::size_t batch_size{10000};
    std::size_t progress_interval{10};
    std::uint64_t seed{default_seed};
    // ignore seed and take one from std::random_device on every reload
    bool random_seed{false};
    std::vector<schema_variant> schemas{schema_variant::base, schema_variant::shadow};

    /**
     * @brief check the configuration, nothing is written when this throws.
     * @throws configuration_error
     */
    void validate() const;
};

/**
 * @brief the largest batch size whose multi-row insert stays within max_bind_parameters.
 */
std::size_t max_batch_size() noexcept;

/**
 * @brief parse "base", "shadow" or "both".
 * @throws configuration_error for any other value
 */
std::vector<schema_variant> parse_schemas(std::string_view value);

}  // namespace matchbench::dataset
