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

#include <matchbench/stub/api.h>
#include "stubImpl.h"

namespace matchbench::stub {

class Connection::Impl
{
public:
    explicit Impl(Stub::Impl*);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
    Impl(Impl&&) = delete;
    Impl& operator=(Impl&&) = delete;

    ErrorCode begin(TransactionPtr&);
    ErrorCode server_error(server_error_info& info);

private:
    Stub::Impl* manager_;
    bool in_transaction_{false};
    server_error_info last_error_{};

    mock::database_mock& database() { return manager_->database(); }
    void end_transaction() { in_transaction_ = false; }

    friend class Transaction::Impl;
    friend class ResultSet::Impl;
};

}  // namespace matchbench::stub
