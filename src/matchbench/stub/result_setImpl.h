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

#include <matchbench/stub/metadata.h>
#include "connectionImpl.h"

namespace matchbench::stub {

/**
 * @brief implementation of the result set, reads single-row results of the query in progress.
 */
class ResultSet::Impl
{
public:
    explicit Impl(Connection::Impl*);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
    Impl(Impl&&) = delete;
    Impl& operator=(Impl&&) = delete;

    ErrorCode next();
    template<typename T>
    ErrorCode next_column(T &value);

private:
    Connection::Impl* manager_;
    result_ptr current_{nullptr, &PQclear};
    Metadata metadata_{};
    bool metadata_valid_{false};
    int c_idx_{};
    bool closed_{false};

    ErrorCode fetch(result_ptr& out);
    void set_metadata(const PGresult* res);
    ErrorCode next_column_common(const char*& text, int& length, Metadata::ColumnType::Type& type);

    /**
     * @brief consume the remaining results of the query so that the connection becomes idle.
     */
    void close();

    friend class Connection::Impl;
};

}  // namespace matchbench::stub
