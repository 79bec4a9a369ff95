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
#include <exception>
#include <charconv>

#include <glog/logging.h>

#include "matchbench/logging.h"
#include "result_setImpl.h"

namespace matchbench::stub {

// type oids of the pg_type catalog
static constexpr Oid int8_oid = 20;
static constexpr Oid int2_oid = 21;
static constexpr Oid int4_oid = 23;

ResultSet::Impl::Impl(Connection::Impl* manager) : manager_(manager)
{
}

ResultSet::Impl::~Impl() {
    try {
        if (!closed_) {
            close();
        }
    } catch (std::exception &ex) {
        std::cerr << ex.what() << std::endl;
    }
}

void ResultSet::Impl::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    auto* conn = manager_->get_native();
    while (auto* res = PQgetResult(conn)) {
        PQclear(res);
    }
    if (manager_->streaming_ == this) {
        manager_->streaming_ = nullptr;
    }
}

void ResultSet::Impl::set_metadata(const PGresult* res) {
    metadata_.clear();
    for (int j = 0; j < PQnfields(res); j++) {
        switch (PQftype(res, j)) {
        case int2_oid:
        case int4_oid:
        case int8_oid:
            metadata_.push(Metadata::ColumnType::Type::INT64);
            break;
        default:
            metadata_.push(Metadata::ColumnType::Type::TEXT);
            break;
        }
    }
    metadata_valid_ = true;
}

ErrorCode ResultSet::Impl::fetch(result_ptr& out)
{
    auto res = make_result_ptr(PQgetResult(manager_->get_native()));
    if (!res) {
        close();
        return ErrorCode::END_OF_ROW;
    }
    switch (PQresultStatus(res.get())) {
    case PGRES_SINGLE_TUPLE:
        if (!metadata_valid_) {
            set_metadata(res.get());
        }
        out = std::move(res);
        return ErrorCode::OK;
    case PGRES_TUPLES_OK:
        // the terminating result of single row mode, carries no row
        if (!metadata_valid_) {
            set_metadata(res.get());
        }
        if (PQntuples(res.get()) > 0) {
            out = std::move(res);
            return ErrorCode::OK;
        }
        close();
        return ErrorCode::END_OF_ROW;
    default:
        manager_->set_error(res.get());
        close();
        return ErrorCode::SERVER_ERROR;
    }
}

/**
 * @brief move current to the next tuple.
 * @return error code defined in error_code.h
 */
ErrorCode ResultSet::Impl::next()
{
    c_idx_ = 0;
    current_.reset();
    if (closed_) {
        return ErrorCode::END_OF_ROW;
    }
    return fetch(current_);
}

ErrorCode ResultSet::Impl::next_column_common(const char*& text, int& length, Metadata::ColumnType::Type& type)
{
    if (!current_) {
        return ErrorCode::END_OF_ROW;
    }
    if (c_idx_ >= PQnfields(current_.get())) {
        return ErrorCode::END_OF_COLUMN;
    }
    auto index = c_idx_++;
    type = metadata_.get_types().at(index).get_type();
    if (PQgetisnull(current_.get(), 0, index) != 0) {
        return ErrorCode::COLUMN_WAS_NULL;
    }
    text = PQgetvalue(current_.get(), 0, index);
    length = PQgetlength(current_.get(), 0, index);
    return ErrorCode::OK;
}

/**
 * @brief get value in integer from the current row.
 * @param value returns the value
 * @return error code defined in error_code.h
 */
template<>
ErrorCode ResultSet::Impl::next_column(std::int64_t& value) {
    const char* text{};
    int length{};
    Metadata::ColumnType::Type type{};
    if (auto rv = next_column_common(text, length, type); rv != ErrorCode::OK) {
        return rv;
    }
    if (type != Metadata::ColumnType::Type::INT64) {
        std::cerr << "error: integral column expected, actually type " << static_cast<int>(type) << " received" << std::endl;
        return ErrorCode::COLUMN_TYPE_MISMATCH;
    }
    auto [ptr, ec] = std::from_chars(text, text + length, value);
    if (ec != std::errc{}) {
        return ErrorCode::COLUMN_TYPE_MISMATCH;
    }
    return ErrorCode::OK;
}

/**
 * @brief get value in text form from the current row, any column type is accepted.
 * @details the view is valid until the next call of next().
 */
template<>
ErrorCode ResultSet::Impl::next_column(std::string_view& value) {
    const char* text{};
    int length{};
    Metadata::ColumnType::Type type{};
    if (auto rv = next_column_common(text, length, type); rv != ErrorCode::OK) {
        return rv;
    }
    value = std::string_view(text, static_cast<std::size_t>(length));
    return ErrorCode::OK;
}
template<>
ErrorCode ResultSet::Impl::next_column(std::string& value) {
    std::string_view v{};
    auto rv = next_column(v);
    if (rv == ErrorCode::OK) {
        value = std::string(v);
    }
    return rv;
}


/**
 * @brief constructor of ResultSet class
 */
ResultSet::ResultSet(std::unique_ptr<ResultSet::Impl> impl) : impl_(std::move(impl)) {}

/**
 * @brief destructor of ResultSet class
 */
ResultSet::~ResultSet() = default;

/**
 * @brief move current to the next tuple.
 */
ErrorCode ResultSet::next()
{
    return impl_->next();
}

/**
 * @brief get value from the current row.
 */
template<>
ErrorCode ResultSet::next_column(std::int64_t& value) { return impl_->next_column(value); }
template<>
ErrorCode ResultSet::next_column(std::string_view& value) { return impl_->next_column(value); }
template<>
ErrorCode ResultSet::next_column(std::string& value) { return impl_->next_column(value); }

}  // namespace matchbench::stub
