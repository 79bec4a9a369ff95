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
    : envelope_(stub), conninfo_(conninfo), pool_size_(pool_size), database_(mock::database_mock::instance()) {
    if (pool_size_ == 0) {
        throw std::invalid_argument("the connection pool must hold at least one connection");
    }
}

ErrorCode Stub::Impl::get_connection(ConnectionPtr& connection)
{
    if (database_.refuses_connections()) {
        return ErrorCode::SERVER_FAILURE;
    }
    if (in_use_ >= pool_size_) {
        return ErrorCode::POOL_EXHAUSTED;
    }
    ++in_use_;
    VLOG(log_trace) << "mock: connection " << in_use_ << "/" << pool_size_ << " to " << conninfo_;
    connection = std::make_unique<Connection>(std::make_unique<Connection::Impl>(this));
    return ErrorCode::OK;
}

void Stub::Impl::release()
{
    --in_use_;
}

Stub::Stub(std::string_view conninfo, std::size_t pool_size)
    : impl_(std::make_unique<Stub::Impl>(this, conninfo, pool_size)) {}

Stub::~Stub() = default;

ErrorCode Stub::get_connection(ConnectionPtr & connection)
{
    return impl_->get_connection(connection);
}

}  // namespace matchbench::stub


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
