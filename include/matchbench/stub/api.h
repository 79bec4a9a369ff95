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

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <matchbench/stub/error_code.h>

using ERROR_CODE = matchbench::stub::ErrorCode;

namespace matchbench::stub {

class ResultSet;
class Transaction;
class Connection;
class Stub;

/**
 * @Brief Result of a query.
 * @details rows are streamed from the server one at a time, a row is valid until the next call of next().
 */
class ResultSet {
    class Impl;

public:
    /**
     * @brief Construct a new object.
     */
    explicit ResultSet(std::unique_ptr<Impl>);

    /**
     * @brief destructs this object.
     */
    ~ResultSet();

    ResultSet(const ResultSet&) = delete;
    ResultSet& operator=(const ResultSet&) = delete;
    ResultSet(ResultSet&&) = delete;
    ResultSet& operator=(ResultSet&&) = delete;

    /**
     * @brief move current to the next tuple.
     * @return error code defined in error_code.h, END_OF_ROW when current reaches end of tuple
     */
    ErrorCode next();

    /**
     * @brief get value of the next column from the current row.
     * @param value returns the value
     * @return error code defined in error_code.h
     */
    template<typename T>
    ErrorCode next_column(T& value);

private:
    std::unique_ptr<Impl> impl_;

    /**
     * @brief get the impl class
     * @return a pointer to the impl class
     */
    auto get_impl() { return impl_.get(); }

    friend class Stub;
    friend class Connection;
    friend class Transaction;
};

}  // namespace matchbench::stub

using ResultSetPtr = std::shared_ptr<matchbench::stub::ResultSet>;


namespace matchbench::stub {

/**
 * @brief a value bound to a positional placeholder ($1, $2, ...).
 */
using value_type = std::variant<std::int64_t, std::string>;
using parameters_type = std::vector<value_type>;

/**
 * @brief Information about a transaction.
 */
class Transaction {
    class Impl;

public:
    /**
     * @brief Construct a new object.
     */
    explicit Transaction(std::unique_ptr<Impl>);

    /**
     * @brief destructs this object, the transaction is rolled back unless it has been committed.
     */
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) = delete;
    Transaction& operator=(Transaction&&) = delete;

    /**
     * @brief execute a statement.
     * @param statement the SQL statement string to be executed
     * @param num_rows a reference to a variable to which the number of processed rows is set
     * @return error code defined in error_code.h
     */
    ErrorCode execute_statement(std::string_view statement, std::size_t& num_rows);

    /**
     * @brief execute a statement with positional parameters.
     * @param statement the SQL statement string to be executed
     * @param parameters the values bound to $1, $2, ...
     * @param num_rows a reference to a variable to which the number of processed rows is set
     * @return error code defined in error_code.h
     */
    ErrorCode execute_statement(std::string_view statement, const parameters_type& parameters, std::size_t& num_rows);

    /**
     * @brief execute a query.
     * @param query the SQL query string to be executed
     * @param result_set returns a result set of the query
     * @return error code defined in error_code.h
     */
    ErrorCode execute_query(std::string_view query, ResultSetPtr& result_set);

    /**
     * @brief execute a query with positional parameters.
     * @param query the SQL query string to be executed
     * @param parameters the values bound to $1, $2, ...
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
    std::unique_ptr<Impl> impl_;

    /**
     * @brief get the impl class
     * @return a pointer to the impl class
     */
    auto get_impl() { return impl_.get(); }

    friend class Stub;
    friend class Connection;
    friend class ResultSet;
};

}  // namespace matchbench::stub

using TransactionPtr = std::unique_ptr<matchbench::stub::Transaction>;


namespace matchbench::stub {

/**
 * @brief Information about a connection checked out from the pool.
 * @details the connection goes back to the pool when this object is destructed.
 */
class Connection {
    class Impl;

public:
    /**
     * @brief Construct a new object.
     */
    explicit Connection(std::unique_ptr<Impl> impl);

    /**
     * @brief destructs this object.
     */
    virtual ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    /**
     * @brief request begin and get Transaction class.
     * @param transaction returns a transaction class
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
    std::unique_ptr<Impl> impl_;

    /**
     * @brief get the impl class
     * @return a pointer to the impl class
     */
    auto get_impl() { return impl_.get(); }

    friend class Stub;
    friend class Transaction::Impl;
    friend class ResultSet::Impl;
};

}  // namespace matchbench::stub

using ConnectionPtr = std::unique_ptr<matchbench::stub::Connection>;


namespace matchbench::stub {

/**
 * @brief environment for server connection, owns the connection pool.
 */
class Stub {
public:
    /**
     * @brief Construct a new object.
     * @param conninfo the libpq connection string
     * @param pool_size the maximum number of connections that can be checked out at a time
     */
    Stub(std::string_view conninfo, std::size_t pool_size);

    /**
     * @brief destructs this object.
     */
    ~Stub();

    Stub(Stub const& other) = delete;
    Stub& operator=(Stub const& other) = delete;
    Stub(Stub&& other) noexcept = delete;
    Stub& operator=(Stub&& other) noexcept = delete;

    /**
     * @brief connect to the DB and get Connection class.
     * @param connection returns a connection class
     * @return error code defined in error_code.h
     */
    ErrorCode get_connection(ConnectionPtr&);

 private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    /**
     * @brief get the impl class
     * @return a pointer to the impl class
     */
    auto get_impl() { return impl_.get(); }

    friend class Connection;
    friend class Connection::Impl;
    friend class Transaction;
    friend class Transaction::Impl;
    friend class ResultSet;
    friend class ResultSet::Impl;
};

}  // namespace matchbench::stub


namespace matchbench::common::param {
using namespace std::string_view_literals;

static const std::string_view DEFAULT_CONNECTION = "dbname=matchbench"sv;
static constexpr std::size_t DEFAULT_POOL_SIZE = 2;
}  // namespace matchbench::common::param

using StubPtr = std::unique_ptr<matchbench::stub::Stub>;

/**
 * @brief create a stub.
 * @param stub returns the stub
 * @param conninfo the libpq connection string
 * @param pool_size the size of the connection pool
 * @return error code defined in error_code.h
 */
ERROR_CODE make_stub(StubPtr& stub,
                     std::string_view conninfo = matchbench::common::param::DEFAULT_CONNECTION,
                     std::size_t pool_size = matchbench::common::param::DEFAULT_POOL_SIZE);
