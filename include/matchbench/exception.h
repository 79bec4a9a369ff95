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

#include <stdexcept>
#include <string>
#include <utility>

#include <matchbench/stub/api.h>

namespace matchbench {

/**
 * @brief root of the exceptions thrown by the dataset generator and the benchmark harness.
 */
class exception : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief invalid configuration, detected before anything is written to the store.
 */
class configuration_error : public exception {
public:
    using exception::exception;
};

/**
 * @brief a generator needed reference data that has not been loaded yet.
 */
class dependency_error : public exception {
public:
    using exception::exception;
};

/**
 * @brief the store rejected a statement or a query, or returned an unexpected row count.
 */
class store_error : public exception {
public:
    store_error(std::string const& what, stub::ErrorCode code, stub::server_error_info info = {})
        : exception(what + ": " + std::string(stub::error_name(code)) + (info.message.empty() ? "" : " - " + info.message)),
          code_(code), info_(std::move(info)) {}

    [[nodiscard]] stub::ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] stub::server_error_info const& info() const noexcept { return info_; }

private:
    stub::ErrorCode code_;
    stub::server_error_info info_;
};

/**
 * @brief throws store_error carrying the server diagnostics unless rc is OK.
 * @param rc the error code returned by the stub API
 * @param connection the connection the failed request was issued on
 * @param what description of the failed request
 */
inline void throw_if_error(stub::ErrorCode rc, stub::Connection& connection, std::string const& what) {
    if (rc == stub::ErrorCode::OK) {
        return;
    }
    stub::server_error_info info{};
    if (connection.server_error(info) != stub::ErrorCode::OK) {
        info = stub::server_error_info{};
    }
    throw store_error(what, rc, std::move(info));
}

}  // namespace matchbench
