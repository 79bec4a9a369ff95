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
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include <matchbench/stub/api.h>
#include <matchbench/dataset/load_config.h>
#include <matchbench/benchmark/query_strategy.h>

namespace matchbench {

/**
 * @brief where the store is and how many connections may be open at a time.
 */
struct store_config {
    std::string connection{common::param::DEFAULT_CONNECTION};
    std::size_t pool_size{common::param::DEFAULT_POOL_SIZE};
};

struct benchmark_config {
    std::size_t iterations{20};
    std::size_t page_size{100};
    std::size_t offset{0};
    std::vector<benchmark::query_strategy> strategies{benchmark::default_strategies()};
    // no report is written when empty
    std::string report_json{};
    std::string latency_csv{};

    /**
     * @throws configuration_error
     */
    void validate() const;
};

struct configuration {
    store_config store{};
    dataset::load_config load{};
    benchmark_config benchmark{};

    /**
     * @brief validate every section.
     * @throws configuration_error
     */
    void validate() const;
};

/**
 * @brief overwrite the options present in the tree.
 * @details keys are the option names, e.g. {"account_count": 100, "schemas": "both"}.
 * @throws configuration_error if a value cannot be converted
 */
configuration from_ptree(boost::property_tree::ptree const& tree, configuration base = {});

/**
 * @brief read a JSON configuration file.
 * @throws configuration_error if the file cannot be read or parsed
 */
configuration load_configuration_file(std::string const& path, configuration base = {});

/**
 * @brief the configuration given by the command line flags.
 * @details when --config names a file, the file is read first and only the flags set explicitly override it.
 * @throws configuration_error
 */
configuration configuration_from_flags();

}  // namespace matchbench
