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

#include <memory>
#include <string>
#include <string_view>

#include <libpq-fe.h>

#include <matchbench/stub/api.h>
#include "stubImpl.h"

namespace matchbench::stub {

using result_ptr = std::unique_ptr<PGresult, decltype(&PQclear)>;

inline result_ptr make_result_ptr(PGresult* res) {
    return result_ptr(res, &PQclear);
}

/**
 * @brief implementation of the connection, a PGconn checked out from Stub::Impl.
 */
class Connection::Impl
{
public:
    Impl(Stub::Impl*, PGconn*);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
    Impl(Impl&&) = delete;
    Impl& operator=(Impl&&) = delete;

    /**
     * @brief begin transaction
     * @param reference to a TransactionPtr
     * @return error code defined in error_code.h
     */
    ErrorCode begin(TransactionPtr&);

    /**
     * @brief get the error of the last SQL executed
     * @param info returns the error reported by the server
     * @return error code defined in error_code.h
     */
    ErrorCode server_error(server_error_info& info);

private:
    Stub::Impl* manager_;
    PGconn* conn_;

    bool in_transaction_{false};
    ResultSet::Impl* streaming_{nullptr};
    server_error_info last_error_{};

    PGconn* get_native() { return conn_; }

    /**
     * @brief execute a command that returns no rows, used for transaction control.
     * @return error code defined in error_code.h
     */
    ErrorCode exec_command(std::string_view command);

    /**
     * @brief record the error carried by the result, or by the connection when res is nullptr.
     */
    void set_error(const PGresult* res);

    /**
     * @brief discard the rest of a streaming query so that the connection accepts a new command.
     */
    void finish_streaming();

    void end_transaction() { in_transaction_ = false; }

    friend class Stub::Impl;
    friend class Transaction::Impl;
    friend class ResultSet::Impl;
};

}  // namespace matchbench::stub
