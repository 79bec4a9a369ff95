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

#include <iostream>
#include <exception>
#include <cstdlib>
#include <string>
#include <vector>

#include <glog/logging.h>

#include "matchbench/logging.h"
#include "transactionImpl.h"

namespace matchbench::stub {

Transaction::Impl::Impl(Connection::Impl* manager) : manager_(manager)
{
}

Transaction::Impl::~Impl()
{
    try {
        if (alive_) {
            rollback();
            alive_ = false;
        }
    } catch (std::exception &ex) {
        std::cerr << ex.what() << std::endl;
    }
}

/**
 * @brief converts a parameter into the text form libpq sends, std::nullopt stands for NULL.
 */
class parameter {
public:
    std::string operator()(const std::int64_t& data) {
        return std::to_string(data);
    }
    std::string operator()(const std::string& data) {
        return data;
    }
};

namespace {

class bound_parameters {
public:
    explicit bound_parameters(const parameters_type& parameters) {
        texts_.reserve(parameters.size());
        for (auto&& e : parameters) {
            texts_.emplace_back(std::visit(parameter{}, e));
        }
        values_.reserve(texts_.size());
        for (auto&& t : texts_) {
            values_.emplace_back(t.c_str());
        }
    }
    [[nodiscard]] int size() const { return static_cast<int>(values_.size()); }
    [[nodiscard]] const char* const* values() const { return values_.empty() ? nullptr : values_.data(); }

private:
    std::vector<std::string> texts_{};
    std::vector<const char*> values_{};
};

}  // namespace

/**
 * @brief execute a statement.
 */
ErrorCode Transaction::Impl::execute_statement(std::string_view statement, const parameters_type& parameters, std::size_t& num_rows) {
    if (!alive_) {
        return ErrorCode::NO_TRANSACTION;
    }
    manager_->finish_streaming();

    bound_parameters bound{parameters};
    std::string sql{statement};
    VLOG(log_trace) << "execute_statement: " << sql.substr(0, 128) << " (" << bound.size() << " parameters)" << std::endl;
    auto res = make_result_ptr(PQexecParams(manager_->get_native(), sql.c_str(), bound.size(), nullptr, bound.values(), nullptr, nullptr, 0));
    if (!res) {
        manager_->set_error(nullptr);
        return ErrorCode::SERVER_FAILURE;
    }
    switch (PQresultStatus(res.get())) {
    case PGRES_COMMAND_OK:
    case PGRES_TUPLES_OK: {
        const char* tuples = PQcmdTuples(res.get());
        num_rows = (tuples != nullptr && *tuples != '\0') ? std::strtoull(tuples, nullptr, 10) : 0;
        return ErrorCode::OK;
    }
    default:
        manager_->set_error(res.get());
        return PQstatus(manager_->get_native()) == CONNECTION_OK ? ErrorCode::SERVER_ERROR : ErrorCode::SERVER_FAILURE;
    }
}

/**
 * @brief execute a query.
 */
ErrorCode Transaction::Impl::execute_query(std::string_view query, const parameters_type& parameters, ResultSetPtr& result_set)
{
    if (!alive_) {
        return ErrorCode::NO_TRANSACTION;
    }
    manager_->finish_streaming();

    bound_parameters bound{parameters};
    std::string sql{query};
    VLOG(log_trace) << "execute_query: " << sql.substr(0, 128) << " (" << bound.size() << " parameters)" << std::endl;
    auto* conn = manager_->get_native();
    if (PQsendQueryParams(conn, sql.c_str(), bound.size(), nullptr, bound.values(), nullptr, nullptr, 0) == 0) {
        manager_->set_error(nullptr);
        return PQstatus(conn) == CONNECTION_OK ? ErrorCode::SERVER_ERROR : ErrorCode::SERVER_FAILURE;
    }
    if (PQsetSingleRowMode(conn) == 0) {
        LOG(ERROR) << "cannot switch the query to single row mode" << std::endl;
        while (auto* res = PQgetResult(conn)) {
            PQclear(res);
        }
        return ErrorCode::UNSUPPORTED;
    }
    auto impl = std::make_unique<ResultSet::Impl>(manager_);
    manager_->streaming_ = impl.get();
    result_set = std::make_shared<ResultSet>(std::move(impl));
    return ErrorCode::OK;
}

ErrorCode Transaction::Impl::end(std::string_view command)
{
    if (!alive_) {
        return ErrorCode::NO_TRANSACTION;
    }
    manager_->finish_streaming();
    alive_ = false;
    auto rc = manager_->exec_command(command);
    manager_->end_transaction();
    VLOG(log_trace) << command << " : " << error_name(rc) << std::endl;
    return rc;
}

/**
 * @brief commit the current transaction.
 */
ErrorCode Transaction::Impl::commit()
{
    return end("COMMIT");
}

/**
 * @brief abort the current transaction.
 */
ErrorCode Transaction::Impl::rollback()
{
    return end("ROLLBACK");
}

/**
 * @brief constructor of Transaction class
 */
Transaction::Transaction(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

/**
 * @brief destructor of Transaction class
 */
Transaction::~Transaction() = default;

ErrorCode Transaction::execute_statement(std::string_view statement, std::size_t& num_rows)
{
    return impl_->execute_statement(statement, parameters_type{}, num_rows);
}

ErrorCode Transaction::execute_statement(std::string_view statement, const parameters_type& parameters, std::size_t& num_rows)
{
    return impl_->execute_statement(statement, parameters, num_rows);
}

ErrorCode Transaction::execute_query(std::string_view query, ResultSetPtr& result_set)
{
    return impl_->execute_query(query, parameters_type{}, result_set);
}

ErrorCode Transaction::execute_query(std::string_view query, const parameters_type& parameters, ResultSetPtr& result_set)
{
    return impl_->execute_query(query, parameters, result_set);
}

ErrorCode Transaction::commit()
{
    return impl_->commit();
}

ErrorCode Transaction::rollback()
{
    return impl_->rollback();
}

}  // namespace matchbench::stub
