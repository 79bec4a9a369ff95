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
#include <matchbench/benchmark/benchmark_runner.h>

#include <chrono>
#include <cstdint>
#include <string_view>

#include <glog/logging.h>

#include <matchbench/exception.h>
#include <matchbench/logging.h>

namespace matchbench::benchmark {

measurement benchmark_runner::measure(query_strategy const& strategy, std::size_t page_size, std::size_t offset, std::size_t iterations) {
    if (iterations == 0) {
        throw configuration_error("iterations must be greater than 0");
    }

    measurement result{};
    result.strategy = strategy.name;
    result.latencies_ms.reserve(iterations);

    auto const query = strategy.sql();
    stub::parameters_type parameters{
        static_cast<std::int64_t>(page_size),
        static_cast<std::int64_t>(offset),
    };
    VLOG(log_debug) << strategy.name << ": " << query;

    ConnectionPtr connection{};
    if (auto rc = stub_.get_connection(connection); rc != stub::ErrorCode::OK) {
        throw store_error("get_connection", rc);
    }
    LOG(INFO) << "measuring " << strategy.name << " (" << to_string_view(strategy.shape) << ", "
              << to_string_view(strategy.variant) << " schema), " << iterations << " runs";

    for (std::size_t i = 0; i < iterations; ++i) {
        TransactionPtr transaction{};
        throw_if_error(connection->begin(transaction), *connection, "begin");

        auto start = std::chrono::steady_clock::now();
        ResultSetPtr result_set{};
        throw_if_error(transaction->execute_query(query, parameters, result_set), *connection, strategy.name);
        std::size_t rows = 0;
        while (true) {
            auto rc = result_set->next();
            if (rc == stub::ErrorCode::END_OF_ROW) {
                break;
            }
            throw_if_error(rc, *connection, strategy.name);
            std::int64_t id{};
            std::string_view state{};
            throw_if_error(result_set->next_column(id), *connection, strategy.name);
            throw_if_error(result_set->next_column(state), *connection, strategy.name);
            ++rows;
        }
        auto elapsed = std::chrono::steady_clock::now() - start;
        result_set.reset();
        throw_if_error(transaction->commit(), *connection, "commit");

        auto ms = std::chrono::duration<double, std::milli>(elapsed).count();
        result.latencies_ms.emplace_back(ms);
        VLOG(log_info) << strategy.name << " run " << (i + 1) << ": " << ms << " ms, " << rows << " rows";
        if (i == 0) {
            result.first_row_count = rows;
            LOG(INFO) << strategy.name << ": result count " << rows;
            if (rows > page_size) {
                LOG(WARNING) << strategy.name << ": " << rows << " rows returned for a page of " << page_size;
            }
        }
    }
    return result;
}

}  // namespace matchbench::benchmark
