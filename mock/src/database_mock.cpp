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
#include <matchbench/mock/database_mock.h>

#include <stdexcept>
#include <type_traits>

#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>
#include <glog/logging.h>

#include <matchbench/logging.h>

namespace matchbench::mock {

namespace {

// statement patterns
const boost::regex insert_pattern{R"(^\s*INSERT\s+INTO\s+(\w+)\s*\(([^)]*)\)\s*VALUES\s.*$)", boost::regex::icase};
const boost::regex truncate_pattern{R"(^\s*TRUNCATE\s+(?:TABLE\s+)?([\w\s,]+?)(?:\s+RESTART\s+IDENTITY)?(?:\s+CASCADE)?\s*$)", boost::regex::icase};
// query patterns
const boost::regex count_pattern{R"(^\s*SELECT\s+COUNT\(\*\)\s+FROM\s+(\w+)\s*$)", boost::regex::icase};
const boost::regex count_where_pattern{R"(^\s*SELECT\s+COUNT\(\*\)\s+FROM\s+(\w+)\s+WHERE\s+(\w+)\s*=\s*'([^']*)'\s*$)", boost::regex::icase};
const boost::regex group_by_pattern{R"(^\s*SELECT\s+(\w+)\s*,\s*COUNT\(\*\)\s+FROM\s+(\w+)\s+GROUP\s+BY\s+(\w+)\s*$)", boost::regex::icase};

std::vector<std::string> split_names(std::string const& list) {
    std::vector<std::string> names{};
    boost::algorithm::split(names, list, boost::is_any_of(","));
    for (auto& n : names) {
        boost::algorithm::trim(n);
    }
    return names;
}

ErrorCode server_error(stub::server_error_info& error, std::string sql_state, std::string message) {
    error.sql_state = std::move(sql_state);
    error.message = std::move(message);
    return ErrorCode::SERVER_ERROR;
}

}  // namespace

std::optional<std::size_t> table::column_index(std::string_view name) const {
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == name) {
            return i;
        }
    }
    return std::nullopt;
}

std::string to_text(value_type const& value) {
    return std::visit([](auto const& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return std::to_string(v);
        }
    }, value);
}

database_mock& database_mock::instance() {
    static database_mock database{};
    return database;
}

void database_mock::reset() {
    tables_.clear();
    journal_.clear();
    handler_ = nullptr;
    failures_.clear();
    refuse_connections_ = false;
    misreported_row_count_ = std::nullopt;
}

table const& database_mock::at(std::string_view name) const {
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        throw std::out_of_range("no table " + std::string(name));
    }
    return it->second;
}

std::size_t database_mock::row_count(std::string_view name) const {
    auto it = tables_.find(name);
    return it == tables_.end() ? 0 : it->second.rows.size();
}

std::vector<value_type> database_mock::column(std::string_view table_name, std::string_view column_name) const {
    auto const& t = at(table_name);
    auto index = t.column_index(column_name);
    if (!index) {
        throw std::out_of_range("no column " + std::string(column_name) + " in " + std::string(table_name));
    }
    std::vector<value_type> values{};
    values.reserve(t.rows.size());
    for (auto const& row : t.rows) {
        values.emplace_back(row.at(*index));
    }
    return values;
}

std::size_t database_mock::count_statements(std::string_view prefix) const {
    std::size_t count = 0;
    for (auto const& e : journal_) {
        if (boost::algorithm::istarts_with(e.sql, prefix)) {
            ++count;
        }
    }
    return count;
}

void database_mock::fail_when(std::string pattern, ErrorCode code, std::string sql_state, std::string message) {
    failures_.emplace_back(failure{std::move(pattern), code, stub::server_error_info{}});
    failures_.back().info.sql_state = std::move(sql_state);
    failures_.back().info.message = std::move(message);
}

void database_mock::record(std::string_view sql, std::size_t parameter_count) {
    journal_.emplace_back(journal_entry{std::string(sql), parameter_count});
}

bool database_mock::injected_failure(std::string_view sql, ErrorCode& code, stub::server_error_info& error) {
    for (auto it = failures_.begin(); it != failures_.end(); ++it) {
        if (sql.find(it->pattern) != std::string_view::npos) {
            code = it->code;
            error = it->info;
            failures_.erase(it);
            return true;
        }
    }
    return false;
}

ErrorCode database_mock::execute_statement(tables_type& working, std::string_view sql, parameters_type const& parameters,
                                           std::size_t& num_rows, stub::server_error_info& error) {
    record(sql, parameters.size());
    if (ErrorCode code{}; injected_failure(sql, code, error)) {
        return code;
    }

    std::string text{sql};
    boost::smatch m;
    if (boost::regex_match(text, m, insert_pattern)) {
        auto columns = split_names(m[2].str());
        auto& target = working[m[1].str()];
        if (target.columns.empty()) {
            target.columns = columns;
        } else if (target.columns != columns) {
            return server_error(error, "42703", "column list differs from the existing rows of " + m[1].str());
        }
        if (parameters.empty() || parameters.size() % columns.size() != 0) {
            return server_error(error, "08P01", std::to_string(parameters.size()) + " parameters for " + std::to_string(columns.size()) + " columns");
        }
        auto rows = parameters.size() / columns.size();
        for (std::size_t r = 0; r < rows; ++r) {
            auto first = parameters.begin() + static_cast<std::ptrdiff_t>(r * columns.size());
            target.rows.emplace_back(first, first + static_cast<std::ptrdiff_t>(columns.size()));
        }
        num_rows = misreported_row_count_ ? *misreported_row_count_ : rows;
        return ErrorCode::OK;
    }
    if (boost::regex_match(text, m, truncate_pattern)) {
        for (auto const& name : split_names(m[1].str())) {
            working[name].rows.clear();
        }
        num_rows = 0;
        return ErrorCode::OK;
    }
    return server_error(error, "0A000", "statement not supported by the mock: " + text);
}

ErrorCode database_mock::execute_query(tables_type const& working, std::string_view sql, parameters_type const& parameters,
                                       query_result& result, stub::server_error_info& error) {
    record(sql, parameters.size());
    if (ErrorCode code{}; injected_failure(sql, code, error)) {
        return code;
    }
    if (handler_) {
        if (auto answer = handler_(sql, parameters, working)) {
            result = std::move(*answer);
            return ErrorCode::OK;
        }
    }

    std::string text{sql};
    boost::smatch m;
    auto find = [&working](std::string const& name) -> table const* {
        auto it = working.find(name);
        return it == working.end() ? nullptr : &it->second;
    };
    if (boost::regex_match(text, m, count_pattern)) {
        auto const* t = find(m[1].str());
        if (t == nullptr) {
            return server_error(error, "42P01", "relation \"" + m[1].str() + "\" does not exist");
        }
        result.rows.emplace_back(std::vector<value_type>{value_type{static_cast<std::int64_t>(t->rows.size())}});
        return ErrorCode::OK;
    }
    if (boost::regex_match(text, m, count_where_pattern)) {
        auto const* t = find(m[1].str());
        if (t == nullptr) {
            return server_error(error, "42P01", "relation \"" + m[1].str() + "\" does not exist");
        }
        auto index = t->column_index(m[2].str());
        if (!index && !t->rows.empty()) {
            return server_error(error, "42703", "column \"" + m[2].str() + "\" does not exist");
        }
        std::int64_t count = 0;
        for (auto const& row : t->rows) {
            if (to_text(row.at(*index)) == m[3].str()) {
                ++count;
            }
        }
        result.rows.emplace_back(std::vector<value_type>{value_type{count}});
        return ErrorCode::OK;
    }
    if (boost::regex_match(text, m, group_by_pattern) && m[1].str() == m[3].str()) {
        auto const* t = find(m[2].str());
        if (t == nullptr) {
            return server_error(error, "42P01", "relation \"" + m[2].str() + "\" does not exist");
        }
        auto index = t->column_index(m[1].str());
        if (!index && !t->rows.empty()) {
            return server_error(error, "42703", "column \"" + m[1].str() + "\" does not exist");
        }
        std::map<std::string, std::int64_t> groups{};
        for (auto const& row : t->rows) {
            ++groups[to_text(row.at(*index))];
        }
        for (auto const& [key, count] : groups) {
            result.rows.emplace_back(std::vector<value_type>{value_type{key}, value_type{count}});
        }
        return ErrorCode::OK;
    }
    VLOG(log_debug) << "mock: unanswered query " << text;
    return server_error(error, "0A000", "query not supported by the mock: " + text);
}

}  // namespace matchbench::mock
