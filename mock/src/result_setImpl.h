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
#include <vector>

#include "connectionImpl.h"

namespace matchbench::stub {

class ResultSet::Impl
{
public:
    explicit Impl(mock::query_result result);
    ~Impl() = default;

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
    Impl(Impl&&) = delete;
    Impl& operator=(Impl&&) = delete;

    ErrorCode next();
    template<typename T>
    ErrorCode next_column(T &value);

private:
    mock::query_result result_;
    // one past the current row, 0 before the first call of next()
    std::size_t position_{};
    std::size_t c_idx_{};
    std::string text_{};

    ErrorCode next_value(value_type const*& value);
};

}  // namespace matchbench::stub
