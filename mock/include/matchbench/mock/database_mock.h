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
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <matchbench/stub/api.h>

namespace matchbench::mock {

using stub::ErrorCode;
using stub::parameters_type;
using stub::value_type;

/**
 * @brief content of a table, the columns are those of the first INSERT into it.
 */
struct table {
    std::vector<std::string> columns{};
    std::vector<std::vector<value_type>> rows{};

    [[nodiscard]] std::optional<std::size_t> column_index(std::string_view name) const;
};

using tables_type = std::map<std::string, table, std::less<>>;

/**
 * @brief rows answered to a query.
 */
struct query_result {
    std::vector<std::vector<value_type>> rows{};
};

/**
 * @brief answers the queries the built-in patterns do not cover, std::nullopt leaves the query unanswered.
 */
using query_handler = std::function<std::optional<query_result>(std::string_view sql, parameters_type const& parameters, tables_type const& tables)>;

struct journal_entry {
    std::string sql{};
    std::size_t parameter_count{};
};

/**
 * @brief text form of a value, as PostgreSQL would print it.
 */
std::string to_text(value_type const& value);

/**
 * @brief in-memory database behind the mock stub.
 * @details understands multi-row INSERT, TRUNCATE and SELECT COUNT(*) with an optional equality
 * filter or a GROUP BY of one column. Changes become visible on commit and are discarded on rollback.
 * Other queries are passed to the query handler.
 */
class database_mock {
public:
    static database_mock& instance();

    /**
     * @brief forget the content, the journal, the handler and the injected failures.
     */
    void reset();

    [[nodiscard]] tables_type const& tables() const noexcept { return tables_; }

    /**
     * @throws std::out_of_range if the table does not exist
     */
    [[nodiscard]] table const& at(std::string_view name) const;

    [[nodiscard]] std::size_t row_count(std::string_view name) const;

    /**
     * @brief the values of a column of the committed content.
     * @throws std::out_of_range if the table or the column does not exist
     */
    [[nodiscard]] std::vector<value_type> column(std::string_view table_name, std::string_view column_name) const;

    [[nodiscard]] std::vector<journal_entry> const& journal() const noexcept { return journal_; }
    [[nodiscard]] std::size_t count_statements(std::string_view prefix) const;

    void set_query_handler(query_handler handler) { handler_ = std::move(handler); }

    /**
     * @brief the next statement or query containing pattern fails with code.
     */
    void fail_when(std::string pattern, ErrorCode code, std::string sql_state = "XX000", std::string message = "injected failure");

    /**
     * @brief make get_connection fail with SERVER_FAILURE.
     */
    void refuse_connections(bool refuse) noexcept { refuse_connections_ = refuse; }

    /**
     * @brief report this row count for every INSERT instead of the number of rows inserted.
     */
    void misreport_row_count(std::optional<std::size_t> count) noexcept { misreported_row_count_ = count; }

    // used by the mock stub
    [[nodiscard]] bool refuses_connections() const noexcept { return refuse_connections_; }
    void record(std::string_view sql, std::size_t parameter_count);
    tables_type snapshot() const { return tables_; }
    void commit(tables_type&& working) { tables_ = std::move(working); }
    ErrorCode execute_statement(tables_type& working, std::string_view sql, parameters_type const& parameters,
                                std::size_t& num_rows, stub::server_error_info& error);
    ErrorCode execute_query(tables_type const& working, std::string_view sql, parameters_type const& parameters,
                            query_result& result, stub::server_error_info& error);

private:
    struct failure {
        std::string pattern;
        ErrorCode code;
        stub::server_error_info info;
    };

    tables_type tables_{};
    std::vector<journal_entry> journal_{};
    query_handler handler_{};
    std::vector<failure> failures_{};
    bool refuse_connections_{false};
    std::optional<std::size_t> misreported_row_count_{};

    bool injected_failure(std::string_view sql, ErrorCode& code, stub::server_error_info& error);
};

}  // namespace matchbench::mock
