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

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

#include <matchbench/stub/api.h>
#include <matchbench/dataset/load_config.h>
#include <matchbench/dataset/random.h>
#include <matchbench/dataset/reference_index.h>
#include <matchbench/dataset/schema.h>

namespace matchbench::dataset {

/**
 * @brief outcome of a reload.
 */
struct load_result {
    // seed the random source was created with
    std::uint64_t seed{};
    // rows written, by table name
    std::map<std::string, std::size_t> row_counts{};
    std::chrono::milliseconds elapsed{};

    [[nodiscard]] std::size_t total_rows() const noexcept;
};

/**
 * @brief replaces the content of the dataset tables with freshly generated rows.
 */
class dataset_loader {
public:
    dataset_loader(stub::Stub& stub, load_config config);

    /**
     * @brief truncate every table of the selected schemas and load them again, in a single transaction.
     * @details the transaction is rolled back when any step fails, leaving the previously committed data.
     * @return the row counts, the seed and the elapsed time
     * @throws configuration_error if the configuration is invalid, nothing is sent to the store then
     * @throws dependency_error if a generator runs before the entity it refers to
     * @throws store_error if the store rejects a statement
     */
    load_result reload();

    [[nodiscard]] load_config const& config() const noexcept { return config_; }

private:
    stub::Stub& stub_;
    load_config config_;
    reference_index references_{};

    void truncate(stub::Transaction& transaction, stub::Connection& connection);
    void load(stub::Transaction& transaction, stub::Connection& connection, schema_variant variant, std::uint64_t seed, load_result& result);
};

}  // namespace matchbench::dataset
