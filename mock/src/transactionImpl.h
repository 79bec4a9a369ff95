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

#include <string_view>

#include "connectionImpl.h"
#include "result_setImpl.h"

namespace matchbench::stub {

/**
 * @brief a transaction working on a copy of the committed tables.
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

    ErrorCode execute_statement(std::string_view statement, const parameters_type& parameters, std::size_t& num_rows);
    ErrorCode execute_query(std::string_view query, const parameters_type& parameters, ResultSetPtr& result_set);
    ErrorCode commit();
    ErrorCode rollback();

private:
    Connection::Impl* manager_;
    mock::tables_type working_;
    bool alive_{true};
    // a failed statement aborts the transaction, as PostgreSQL does
    bool aborted_{false};

    ErrorCode check_usable();
};

}  // namespace matchbench::stub
