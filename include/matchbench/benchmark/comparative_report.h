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
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include <matchbench/benchmark/benchmark_runner.h>

namespace matchbench::benchmark {

/**
 * @brief order statistics of the latencies of one strategy, in milliseconds.
 */
struct strategy_statistics {
    std::string strategy{};
    std::size_t samples{};
    double mean{};
    double min{};
    double max{};
    double median{};
    double p95{};
};

/**
 * @brief mean(numerator) / mean(denominator).
 */
struct comparison {
    std::string numerator{};
    std::string denominator{};
    double ratio{};
};

struct summary {
    // in measurement order
    std::vector<strategy_statistics> statistics{};
    // every ordered pair of distinct strategies
    std::vector<comparison> comparisons{};

    /**
     * @throws std::out_of_range if the strategy has not been summarized
     */
    [[nodiscard]] strategy_statistics const& of(std::string_view strategy) const;
    [[nodiscard]] double ratio(std::string_view numerator, std::string_view denominator) const;
};

/**
 * @brief arithmetic mean.
 * @throws std::invalid_argument for an empty sequence
 */
double mean(std::vector<double> const& values);

/**
 * @brief the smallest sample such that at least percent % of the samples are not greater.
 * @throws std::invalid_argument for an empty sequence or a percent outside (0, 100]
 */
double percentile(std::vector<double> values, double percent);

/**
 * @brief numerator / denominator, +infinity when the denominator is 0.
 */
double ratio(double numerator, double denominator) noexcept;

/**
 * @brief statistics of every measurement and the ratios of their means.
 * @throws std::invalid_argument if a measurement has no samples
 */
summary summarize(std::vector<measurement> const& measurements);

/**
 * @brief human readable report, the statistics and how many times faster each strategy is than the previous one.
 */
void print(summary const& s, std::ostream& out);

boost::property_tree::ptree to_ptree(summary const& s);

/**
 * @brief write the summary as JSON.
 * @throws boost::property_tree::json_parser_error if the file cannot be written
 */
void write_json(summary const& s, std::string const& path);

/**
 * @brief write every sample as a strategy,run,latency_ms line.
 * @throws std::runtime_error if the file cannot be written
 */
void write_latency_csv(std::vector<measurement> const& measurements, std::string const& path);

}  // namespace matchbench::benchmark
