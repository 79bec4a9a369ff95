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
#include "connectionImpl.h"
#include "transactionImpl.h"

namespace matchbench::stub {

Connection::Impl::Impl(Stub::Impl* manager) : manager_(manager)
{
}

Connection::Impl::~Impl()
{
    manager_->release();
}

ErrorCode Connection::Impl::begin(TransactionPtr& transaction)
{
    if (in_transaction_) {
        return ErrorCode::TRANSACTION_ALREADY_STARTED;
    }
    database().record("BEGIN", 0);
    in_transaction_ = true;
    transaction = std::make_unique<Transaction>(std::make_unique<Transaction::Impl>(this));
    return ErrorCode::OK;
}

ErrorCode Connection::Impl::server_error(server_error_info& info)
{
    info = last_error_;
    return ErrorCode::OK;
}

Connection::Connection(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Connection::~Connection() = default;

ErrorCode Connection::begin(TransactionPtr& transaction) { return impl_->begin(transaction); }

ErrorCode Connection::server_error(server_error_info& info) { return impl_->server_error(info); }

}  // namespace matchbench::stub
