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
#include <vector>

#include "matchbench/stub/error_code.h"

namespace matchbench::stub {

/**
 * @brief Provides semantic information of a ResultSet.
 */
class Metadata {
public:
    /**
     * @brief Provides semantic information of a Column.
     */
    class ColumnType {
    public:
        /**
         * @brief represents a type.
         */
        enum class Type {
            /**
             * @brief integral number type, int2, int4 and int8 columns are all read as 64bit.
             */
            INT64 = 0,

            /**
             * @brief any other type, read in text form.
             */
            TEXT = 1,
        };

        /**
         * @brief Construct a new object.
         * @param type tag for the column type
         */
        ColumnType(Type type) : type_(type) {}  // NOLINT(google-explicit-constructor)

        /**
         * @brief Copy and move constructers.
         */
        ColumnType() = default;
        ColumnType(const ColumnType&) = default;
        ColumnType& operator=(const ColumnType&) = default;
        ColumnType(ColumnType&&) = default;
        ColumnType& operator=(ColumnType&&) = default;

        /**
         * @brief destructs this object.
         */
        ~ColumnType() noexcept = default;

        /**
         * @brief get type for this column.
         * @return Type of this column
         */
        ColumnType::Type get_type() const { return type_; }

    private:
        Type type_{};
    };

    /**
     * @brief Container to store type data for the columns.
     */
    using SetOfTypeData = std::vector<ColumnType>;

    /**
     * @brief Construct a new object.
     */
    Metadata() = default;

    /**
     * @brief destructs this object.
     */
    ~Metadata() noexcept = default;

    /**
     * @brief get a set of type data for this result set.
     * @return the type data
     */
    const SetOfTypeData& get_types() const noexcept { return columns_; }

    /**
     * @brief push a column type.
     * @param t the type of the column
     */
    void push(ColumnType::Type t) { columns_.emplace_back(ColumnType(t)); }

    /**
     * @brief clear this metadata.
     */
    void clear() { columns_.clear(); }

private:
    SetOfTypeData columns_;
};

}  // namespace matchbench::stub
