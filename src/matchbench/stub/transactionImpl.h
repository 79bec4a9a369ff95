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

#include "connectionImpl.h"
#include "result_setImpl.h"

namespace matchbench::stub {

/**
 * @brief implementation of the transaction, a BEGIN ... COMMIT block on the owning connection.
 */
class Transaction::Impl
{
public:
    explicit Impl(Connection::Impl*);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
    Impl(Impl&&) = delete;
    Impl& operator=(Impl&&) = delete;

    /**
     * @brief execute a statement.
     * @param statement the SQL statement string
     * @param parameters the values bound to the positional placeholders
     * @param num_rows returns the number of rows the statement processed
     * @return error code defined in error_code.h
     */
    ErrorCode execute_statement(std::string_view statement, const parameters_type& parameters, std::size_t& num_rows);

    /**
     * @brief execute a query, the rows are streamed through the result set.
     * @param query the SQL query string
     * @param parameters the values bound to the positional placeholders
     * @param result_set returns a result set of the query
     * @return error code defined in error_code.h
     */
    ErrorCode execute_query(std::string_view query, const parameters_type& parameters, ResultSetPtr& result_set);

    /**
     * @brief commit the current transaction.
     * @return error code defined in error_code.h
     */
    ErrorCode commit();

    /**
     * @brief abort the current transaction.
     * @return error code defined in error_code.h
     */
    ErrorCode rollback();

private:
    Connection::Impl* manager_;
    bool alive_{true};

    /**
     * @brief get the object to which this belongs
     * @return connection object
     */
    auto get_manager() { return manager_; }

    ErrorCode end(std::string_view command);

    friend class ResultSet::Impl;
};

}  // namespace matchbench::stub
