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
#include <string_view>
#include <vector>

#include <glog/logging.h>

#include <matchbench/exception.h>
#include <matchbench/logging.h>
#include <matchbench/stub/api.h>
#include <matchbench/dataset/row_traits.h>
#include <matchbench/dataset/schema.h>

namespace matchbench::dataset {

/**
 * @brief writes generated rows with one multi-row INSERT per batch.
 * @details only one batch of rows is held in memory at a time.
 */
class row_batch_writer {
public:
    /**
     * @brief create a writer issuing its statements in the given transaction.
     * @param transaction the transaction of the load
     * @param connection the connection the transaction belongs to, consulted for error details
     * @param variant the schema the rows go to
     * @param batch_size the number of rows that closes a batch
     * @param progress_interval a progress line is logged every progress_interval batches
     */
    row_batch_writer(stub::Transaction& transaction,
                     stub::Connection& connection,
                     schema_variant variant,
                     std::size_t batch_size,
                     std::size_t progress_interval)
        : transaction_(transaction), connection_(connection), variant_(variant),
          batch_size_(batch_size), progress_interval_(progress_interval) {}

    /**
     * @brief generate and write the rows of the logical indices [0, total).
     * @param label name in the progress lines
     * @param total the number of logical indices
     * @param producer called as producer(index, rows), appends the rows of the index to rows
     * @return the number of rows written
     * @throws store_error if a batch is rejected or the store reports a different row count
     */
    template <typename Row, typename Producer>
    std::size_t write_batches(std::string_view label, std::size_t total, Producer&& producer) {
        std::vector<Row> rows{};
        rows.reserve(batch_size_);
        std::size_t written = 0;
        std::size_t batches = 0;
        for (std::size_t index = 0; index < total; ++index) {
            producer(index, rows);
            if (rows.size() >= batch_size_ || index + 1 == total) {
                written += flush(rows);
                ++batches;
                if (progress_interval_ != 0 && batches % progress_interval_ == 0) {
                    LOG(INFO) << "  " << label << ": " << written << " rows written ("
                              << (index + 1) << "/" << total << ")";
                }
            }
        }
        LOG(INFO) << label << ": " << written << " rows in " << batches << " batches";
        return written;
    }

private:
    stub::Transaction& transaction_;
    stub::Connection& connection_;
    schema_variant variant_;
    std::size_t batch_size_;
    std::size_t progress_interval_;

    template <typename Row>
    std::size_t flush(std::vector<Row>& rows) {
        if (rows.empty()) {
            return 0;
        }
        stub::parameters_type parameters{};
        parameters.reserve(rows.size() * row_traits<Row>::columns.size());
        for (auto const& row : rows) {
            row_traits<Row>::bind(row, parameters);
        }
        auto statement = insert_statement<Row>(variant_, rows.size());
        std::size_t num_rows{};
        auto table = table_name(row_traits<Row>::entity, variant_);
        throw_if_error(transaction_.execute_statement(statement, parameters, num_rows), connection_, "insert into " + table);
        if (num_rows != rows.size()) {
            stub::server_error_info info{};
            info.message = "expected " + std::to_string(rows.size()) + " rows, the store reported " + std::to_string(num_rows);
            throw store_error("insert into " + table, stub::ErrorCode::UNKNOWN, info);
        }
        VLOG(log_trace) << table << ": batch of " << num_rows << " rows";
        auto count = rows.size();
        rows.clear();
        return count;
    }
};

}  // namespace matchbench::dataset
