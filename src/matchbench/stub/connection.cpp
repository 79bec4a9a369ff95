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

#include <string>

#include <glog/logging.h>

#include "matchbench/logging.h"
#include "connectionImpl.h"
#include "transactionImpl.h"
#include "result_setImpl.h"

namespace matchbench::stub {

Connection::Impl::Impl(Stub::Impl* manager, PGconn* conn) : manager_(manager), conn_(conn)
{
}

Connection::Impl::~Impl()
{
    bool reusable = true;
    if (streaming_ != nullptr) {
        finish_streaming();
    }
    if (in_transaction_) {
        // the owner of the transaction did not end it, leave nothing behind on the pooled connection
        reusable = exec_command("ROLLBACK") == ErrorCode::OK;
        in_transaction_ = false;
    }
    manager_->release(conn_, reusable);
}

ErrorCode Connection::Impl::exec_command(std::string_view command)
{
    auto res = make_result_ptr(PQexec(conn_, std::string(command).c_str()));
    if (!res) {
        set_error(nullptr);
        return ErrorCode::SERVER_FAILURE;
    }
    if (PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        set_error(res.get());
        return PQstatus(conn_) == CONNECTION_OK ? ErrorCode::SERVER_ERROR : ErrorCode::SERVER_FAILURE;
    }
    return ErrorCode::OK;
}

void Connection::Impl::set_error(const PGresult* res)
{
    if (res != nullptr) {
        const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
        last_error_.sql_state = state != nullptr ? state : "";
        last_error_.message = PQresultErrorMessage(res);
    } else {
        last_error_.sql_state.clear();
        last_error_.message = PQerrorMessage(conn_);
    }
    VLOG(log_debug) << "server error [" << last_error_.sql_state << "] " << last_error_.message;
}

void Connection::Impl::finish_streaming()
{
    if (streaming_ != nullptr) {
        auto* rs = streaming_;
        streaming_ = nullptr;
        rs->close();
    }
}

/**
 * @brief begin transaction
 * @param transaction returns a transaction class
 * @return error code defined in error_code.h
 */
ErrorCode Connection::Impl::begin(TransactionPtr& transaction)
{
    if (in_transaction_) {
        return ErrorCode::TRANSACTION_ALREADY_STARTED;
    }
    finish_streaming();
    if (auto rc = exec_command("BEGIN"); rc != ErrorCode::OK) {
        return rc;
    }
    in_transaction_ = true;
    transaction = std::make_unique<Transaction>(std::make_unique<Transaction::Impl>(this));
    VLOG(log_trace) << "begin" << std::endl;
    return ErrorCode::OK;
}

ErrorCode Connection::Impl::server_error(server_error_info& info)
{
    info = last_error_;
    return ErrorCode::OK;
}

/**
 * @brief constructor of Connection class
 */
Connection::Connection(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

/**
 * @brief destructor of Connection class
 */
Connection::~Connection() = default;

/**
 * @brief begin transaction
 */
ErrorCode Connection::begin(TransactionPtr& transaction) { return impl_->begin(transaction); }

/**
 * @brief get the error of the last SQL executed
 */
ErrorCode Connection::server_error(server_error_info& info) { return impl_->server_error(info); }

}  // namespace matchbench::stub
