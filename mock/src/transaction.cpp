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
#include "transactionImpl.h"

namespace matchbench::stub {

Transaction::Impl::Impl(Connection::Impl* manager)
    : manager_(manager), working_(manager->database().snapshot())
{
}

Transaction::Impl::~Impl()
{
    if (alive_) {
        (void) rollback();
    }
}

ErrorCode Transaction::Impl::check_usable()
{
    if (!alive_) {
        return ErrorCode::NO_TRANSACTION;
    }
    if (aborted_) {
        manager_->last_error_.sql_state = "25P02";
        manager_->last_error_.message = "current transaction is aborted, commands ignored until end of transaction block";
        return ErrorCode::SERVER_ERROR;
    }
    return ErrorCode::OK;
}

ErrorCode Transaction::Impl::execute_statement(std::string_view statement, const parameters_type& parameters, std::size_t& num_rows)
{
    if (auto rc = check_usable(); rc != ErrorCode::OK) {
        return rc;
    }
    auto rc = manager_->database().execute_statement(working_, statement, parameters, num_rows, manager_->last_error_);
    aborted_ = rc != ErrorCode::OK;
    return rc;
}

ErrorCode Transaction::Impl::execute_query(std::string_view query, const parameters_type& parameters, ResultSetPtr& result_set)
{
    if (auto rc = check_usable(); rc != ErrorCode::OK) {
        return rc;
    }
    mock::query_result result{};
    auto rc = manager_->database().execute_query(working_, query, parameters, result, manager_->last_error_);
    if (rc != ErrorCode::OK) {
        aborted_ = true;
        return rc;
    }
    result_set = std::make_shared<ResultSet>(std::make_unique<ResultSet::Impl>(std::move(result)));
    return ErrorCode::OK;
}

ErrorCode Transaction::Impl::commit()
{
    if (!alive_) {
        return ErrorCode::NO_TRANSACTION;
    }
    alive_ = false;
    manager_->end_transaction();
    if (aborted_) {
        // PostgreSQL answers COMMIT of an aborted transaction with ROLLBACK
        manager_->database().record("ROLLBACK", 0);
        return ErrorCode::OK;
    }
    manager_->database().record("COMMIT", 0);
    manager_->database().commit(std::move(working_));
    return ErrorCode::OK;
}

ErrorCode Transaction::Impl::rollback()
{
    if (!alive_) {
        return ErrorCode::NO_TRANSACTION;
    }
    alive_ = false;
    manager_->end_transaction();
    manager_->database().record("ROLLBACK", 0);
    return ErrorCode::OK;
}

Transaction::Transaction(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

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
