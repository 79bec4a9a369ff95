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
#include <stdexcept>

#include <glog/logging.h>

#include "matchbench/logging.h"
#include "connectionImpl.h"
#include "stubImpl.h"

namespace matchbench::stub {

Stub::Impl::Impl(Stub *stub, std::string_view conninfo, std::size_t pool_size)
    : envelope_(stub), conninfo_(conninfo), pool_size_(pool_size) {
    if (pool_size_ == 0) {
        throw std::invalid_argument("the connection pool must hold at least one connection");
    }
}

Stub::Impl::~Impl() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (in_use_ != 0) {
        LOG(WARNING) << in_use_ << " connection(s) still checked out at stub destruction" << std::endl;
    }
    for (auto* conn : idle_) {
        PQfinish(conn);
    }
    idle_.clear();
}

ErrorCode Stub::Impl::acquire(PGconn*& conn)
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (!idle_.empty()) {
        conn = idle_.back();
        idle_.pop_back();
        ++in_use_;
        return ErrorCode::OK;
    }
    if (in_use_ >= pool_size_) {
        return ErrorCode::POOL_EXHAUSTED;
    }
    // reserve the slot, the caller opens the connection outside the lock
    conn = nullptr;
    ++in_use_;
    return ErrorCode::OK;
}

/**
 * @brief check out a connection, opening a new one while the pool has not reached its size.
 * @param connection returns a connection class
 * @return error code defined in error_code.h
 */
ErrorCode Stub::Impl::get_connection(ConnectionPtr& connection)
{
    PGconn* conn{};
    if (auto rc = acquire(conn); rc != ErrorCode::OK) {
        VLOG(log_debug) << "connection pool exhausted (" << pool_size_ << ")" << std::endl;
        return rc;
    }
    if (conn == nullptr) {
        conn = PQconnectdb(conninfo_.c_str());
        if (conn == nullptr || PQstatus(conn) != CONNECTION_OK) {
            LOG(ERROR) << "connection failed: " << (conn != nullptr ? PQerrorMessage(conn) : "out of memory");
            if (conn != nullptr) {
                PQfinish(conn);
            }
            std::lock_guard<std::mutex> lock(mtx_);
            --in_use_;
            return ErrorCode::SERVER_FAILURE;
        }
        VLOG(log_debug) << "opened a new connection, server version " << PQserverVersion(conn) << std::endl;
    }
    auto connection_impl = std::make_unique<Connection::Impl>(this, conn);
    connection = std::make_unique<Connection>(std::move(connection_impl));
    return ErrorCode::OK;
}

void Stub::Impl::release(PGconn* conn, bool reusable)
{
    std::lock_guard<std::mutex> lock(mtx_);
    --in_use_;
    if (reusable && PQstatus(conn) == CONNECTION_OK && PQtransactionStatus(conn) == PQTRANS_IDLE) {
        idle_.emplace_back(conn);
        return;
    }
    VLOG(log_debug) << "discarding a connection that cannot be reused" << std::endl;
    PQfinish(conn);
}

/**
 * @brief constructor of Stub class
 */
Stub::Stub(std::string_view conninfo, std::size_t pool_size)
    : impl_(std::make_unique<Stub::Impl>(this, conninfo, pool_size)) {}

/**
 * @brief destructor of Stub class
 */
Stub::~Stub() = default;

/**
 * @brief connect to the DB and get Connection class.
 */
ErrorCode Stub::get_connection(ConnectionPtr & connection)
{
    return impl_->get_connection(connection);
}

}  // namespace matchbench::stub


// place make_stub() outside the namespace
ERROR_CODE make_stub(StubPtr &stub, std::string_view conninfo, std::size_t pool_size)
{
    try {
        stub = std::make_unique<matchbench::stub::Stub>(conninfo, pool_size);
    }
    catch (std::invalid_argument &e) {
        std::cerr << e.what() << std::endl;
        return ERROR_CODE::INVALID_PARAMETER;
    }
    return ERROR_CODE::OK;
}
