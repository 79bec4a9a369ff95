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
#include <string>
#include <string_view>

#include <matchbench/stub/api.h>
#include <matchbench/mock/database_mock.h>

namespace matchbench::stub {

/**
 * @brief a pool of connections to the in-memory database.
 */
class Stub::Impl
{
public:
    Impl(Stub *, std::string_view, std::size_t);
    ~Impl() = default;

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
    Impl(Impl&&) = delete;
    Impl& operator=(Impl&&) = delete;

    ErrorCode get_connection(ConnectionPtr&);
    void release();

    mock::database_mock& database() { return database_; }

private:
    const Stub *envelope_;
    const std::string conninfo_;
    const std::size_t pool_size_;
    std::size_t in_use_{};
    mock::database_mock& database_;

    friend class Stub;
};

}  // namespace matchbench::stub
