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
#include <utility>

#include "result_setImpl.h"

namespace matchbench::stub {

ResultSet::Impl::Impl(mock::query_result result) : result_(std::move(result))
{
}

ErrorCode ResultSet::Impl::next()
{
    c_idx_ = 0;
    if (position_ >= result_.rows.size()) {
        position_ = result_.rows.size() + 1;
        return ErrorCode::END_OF_ROW;
    }
    ++position_;
    return ErrorCode::OK;
}

ErrorCode ResultSet::Impl::next_value(value_type const*& value)
{
    if (position_ == 0 || position_ > result_.rows.size()) {
        return ErrorCode::END_OF_ROW;
    }
    auto const& row = result_.rows[position_ - 1];
    if (c_idx_ >= row.size()) {
        return ErrorCode::END_OF_COLUMN;
    }
    value = &row[c_idx_++];
    return ErrorCode::OK;
}

template<>
ErrorCode ResultSet::Impl::next_column(std::int64_t& value) {
    value_type const* v{};
    if (auto rv = next_value(v); rv != ErrorCode::OK) {
        return rv;
    }
    if (auto const* i = std::get_if<std::int64_t>(v)) {
        value = *i;
        return ErrorCode::OK;
    }
    return ErrorCode::COLUMN_TYPE_MISMATCH;
}

// any column in text form, as the libpq stub does
template<>
ErrorCode ResultSet::Impl::next_column(std::string_view& value) {
    value_type const* v{};
    if (auto rv = next_value(v); rv != ErrorCode::OK) {
        return rv;
    }
    text_ = mock::to_text(*v);
    value = text_;
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

ResultSet::ResultSet(std::unique_ptr<ResultSet::Impl> impl) : impl_(std::move(impl)) {}

ResultSet::~ResultSet() = default;

ErrorCode ResultSet::next()
{
    return impl_->next();
}

template<>
ErrorCode ResultSet::next_column(std::int64_t& value) { return impl_->next_column(value); }
template<>
ErrorCode ResultSet::next_column(std::string_view& value) { return impl_->next_column(value); }
template<>
ErrorCode ResultSet::next_column(std::string& value) { return impl_->next_column(value); }

}  // namespace matchbench::stub
