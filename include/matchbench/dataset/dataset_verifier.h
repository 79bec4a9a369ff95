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
#include <map>
#include <string>
#include <vector>

#include <matchbench/stub/api.h>
#include <matchbench/dataset/entities.h>
#include <matchbench/dataset/load_config.h>
#include <matchbench/dataset/schema.h>

namespace matchbench::dataset {

/**
 * @brief row counts of a schema and the deviations found in them.
 */
struct verification_result {
    schema_variant variant{schema_variant::base};
    std::map<std::string, std::size_t> row_counts{};
    std::map<matching_type, std::size_t> matching_counts{};
    std::size_t waiting_count{};
    std::vector<std::string> issues{};

    [[nodiscard]] bool ok() const noexcept { return issues.empty(); }
};

/**
 * @brief checks that the tables hold the dataset a complete load of the configuration produces.
 */
class dataset_verifier {
public:
    dataset_verifier(stub::Stub& stub, load_config config);

    /**
     * @brief count the rows of every table of the schema and compare with the configuration.
     * @throws store_error if a query fails
     */
    verification_result verify(schema_variant variant);

private:
    stub::Stub& stub_;
    load_config config_;
};

}  // namespace matchbench::dataset
