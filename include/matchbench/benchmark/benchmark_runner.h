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

#include <matchbench/stub/api.h>
#include <matchbench/benchmark/query_strategy.h>

namespace matchbench::benchmark {

/**
 * @brief latencies of the runs of one strategy.
 */
struct measurement {
    std::string strategy{};
    // wall-clock time of each run in milliseconds, in run order
    std::vector<double> latencies_ms{};
    // rows returned by the first run
    std::size_t first_row_count{};
};

/**
 * @brief runs query strategies against the store, one run at a time.
 */
class benchmark_runner {
public:
    explicit benchmark_runner(stub::Stub& stub) : stub_(stub) {}

    /**
     * @brief run the strategy iterations times.
     * @details each run executes the query in its own transaction and reads every row, the time
     * from sending the query until the last row is read is recorded.
     * @param strategy the strategy to run
     * @param page_size bound to $1
     * @param offset bound to $2
     * @param iterations the number of runs
     * @return the latency of every run
     * @throws configuration_error if iterations is 0
     * @throws store_error if a run fails, the measurement is abandoned
     */
    measurement measure(query_strategy const& strategy, std::size_t page_size, std::size_t offset, std::size_t iterations);

private:
    stub::Stub& stub_;
};

}  // namespace matchbench::benchmark
