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

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <libpq-fe.h>

#include "matchbench/stub/api.h"

namespace matchbench::stub {

/**
 * @brief a pool of libpq connections sharing one connection string.
 */
class Stub::Impl
{
public:
    Impl(Stub *, std::string_view, std::size_t);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
    Impl(Impl&&) = delete;
    Impl& operator=(Impl&&) = delete;

    ErrorCode get_connection(ConnectionPtr&);

    /**
     * @brief give a connection back to the pool.
     * @param conn the native connection
     * @param reusable false if the connection is broken or in an unknown transaction state
     */
    void release(PGconn* conn, bool reusable);

    std::string_view get_conninfo() { return conninfo_; }

private:
    const Stub *envelope_;
    const std::string conninfo_;
    const std::size_t pool_size_;

    std::mutex mtx_{};
    std::vector<PGconn*> idle_{};
    std::size_t in_use_{};

    ErrorCode acquire(PGconn*&);

    friend class Stub;
};

}  // namespace matchbench::stub
