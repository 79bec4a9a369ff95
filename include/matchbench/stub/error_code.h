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
#include <string>
#include <string_view>

namespace matchbench::stub {

/**
 * @brief The types of errors that can occur in the data handling with matchbench stub.
 */
enum class ErrorCode {

    /**
     * @brief Success
     */
    OK = 0,

    /**
     * @brief NULL has been observed as the column value (a result of successful processing).
     */
    COLUMN_WAS_NULL,

    /**
     * @brief Current in the ResultSet stepped over the last row (a result of successful processing).
     */
    END_OF_ROW,

    /**
     * @brief Current Column in the Row stepped over the last column (a result of successful processing).
     */
    END_OF_COLUMN,

    /**
     * @brief the column value has been requested for a different type than the actual type.
     */
    COLUMN_TYPE_MISMATCH,

    /**
     * @brief function not supported.
     */
    UNSUPPORTED,

    /**
     * @brief transaction not started.
     */
    NO_TRANSACTION,

    /**
     * @brief parameter value is invalid.
     */
    INVALID_PARAMETER,

    /**
     * @brief every connection of the pool is in use.
     */
    POOL_EXHAUSTED,

    /**
     * @brief unknown error.
     */
    UNKNOWN,

    /**
     * @brief could not reach the server, or the server connection was lost.
     */
    SERVER_FAILURE,

    /**
     * @brief trying to begin a transaction when it has already been started
     */
    TRANSACTION_ALREADY_STARTED,

    /**
     * @brief Encountered server error, where you can obtain error detail with Connection::server_error() API.
     */
    SERVER_ERROR,
};

constexpr std::string_view error_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::OK: return "OK";
    case ErrorCode::COLUMN_WAS_NULL: return "COLUMN_WAS_NULL";
    case ErrorCode::END_OF_ROW: return "END_OF_ROW";
    case ErrorCode::END_OF_COLUMN: return "END_OF_COLUMN";
    case ErrorCode::COLUMN_TYPE_MISMATCH: return "COLUMN_TYPE_MISMATCH";
    case ErrorCode::UNSUPPORTED: return "UNSUPPORTED";
    case ErrorCode::NO_TRANSACTION: return "NO_TRANSACTION";
    case ErrorCode::INVALID_PARAMETER: return "INVALID_PARAMETER";
    case ErrorCode::POOL_EXHAUSTED: return "POOL_EXHAUSTED";
    case ErrorCode::UNKNOWN: return "UNKNOWN";
    case ErrorCode::SERVER_FAILURE: return "SERVER_FAILURE";
    case ErrorCode::TRANSACTION_ALREADY_STARTED: return "TRANSACTION_ALREADY_STARTED";
    case ErrorCode::SERVER_ERROR: return "SERVER_ERROR";
    default: return "This ERROR_CODE is illegal";
    }
}

/**
 * @brief detail of the last error reported by the server.
 */
struct server_error_info {
    // five character SQLSTATE, empty when the error did not come from a statement
    std::string sql_state{};  //NOLINT(misc-non-private-member-variables-in-classes)
    std::string message{};    //NOLINT(misc-non-private-member-variables-in-classes)

    server_error_info() = default;
};

}  // namespace matchbench::stub
