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
#include <matchbench/dataset/dataset_verifier.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <glog/logging.h>

#include <matchbench/exception.h>
#include <matchbench/logging.h>
#include <matchbench/dataset/generators.h>

namespace matchbench::dataset {

namespace {

class verification_session {
public:
    verification_session(stub::Connection& connection, stub::Transaction& transaction)
        : connection_(connection), transaction_(transaction) {}

    std::size_t count(std::string const& query) {
        std::size_t result{};
        for_each_row(query, [&result](stub::ResultSet& rs) {
            std::int64_t value{};
            throw_if_column_error(rs.next_column(value));
            result = static_cast<std::size_t>(value);
        });
        return result;
    }

    template <typename F>
    void for_each_row(std::string const& query, F&& f) {
        VLOG(log_trace) << query;
        ResultSetPtr rs{};
        throw_if_error(transaction_.execute_query(query, rs), connection_, query);
        while (true) {
            auto rc = rs->next();
            if (rc == stub::ErrorCode::END_OF_ROW) {
                break;
            }
            throw_if_error(rc, connection_, query);
            f(*rs);
        }
    }

    static void throw_if_column_error(stub::ErrorCode rc) {
        if (rc != stub::ErrorCode::OK) {
            throw store_error("unexpected column value", rc);
        }
    }

private:
    stub::Connection& connection_;
    stub::Transaction& transaction_;
};

void expect_exact(verification_result& result, std::string const& table, std::size_t expected) {
    auto actual = result.row_counts[table];
    if (actual != expected) {
        result.issues.emplace_back(table + ": " + std::to_string(actual) + " rows, expected " + std::to_string(expected));
    }
}

void expect_within(verification_result& result, std::string const& table, std::size_t low, std::size_t high) {
    auto actual = result.row_counts[table];
    if (actual < low || high < actual) {
        result.issues.emplace_back(table + ": " + std::to_string(actual) + " rows, expected between " +
                                   std::to_string(low) + " and " + std::to_string(high));
    }
}

}  // namespace

dataset_verifier::dataset_verifier(stub::Stub& stub, load_config config)
    : stub_(stub), config_(std::move(config)) {
}

verification_result dataset_verifier::verify(schema_variant variant) {
    verification_result result{};
    result.variant = variant;

    ConnectionPtr connection{};
    if (auto rc = stub_.get_connection(connection); rc != stub::ErrorCode::OK) {
        throw store_error("get_connection", rc);
    }
    TransactionPtr transaction{};
    throw_if_error(connection->begin(transaction), *connection, "begin");
    verification_session session{*connection, *transaction};

    for (auto entity : load_order) {
        auto table = table_name(entity, variant);
        result.row_counts[table] = session.count("SELECT COUNT(*) FROM " + table);
    }
    auto dg_table = table_name(entity_type::distribution_group, variant);
    result.waiting_count = session.count("SELECT COUNT(*) FROM " + dg_table + " WHERE state = '" +
                                         std::string(to_string_view(distribution_group_state::waiting)) + "'");
    auto matching_table = table_name(entity_type::distribution_group_matching, variant);
    session.for_each_row("SELECT type, COUNT(*) FROM " + matching_table + " GROUP BY type",
        [&result](stub::ResultSet& rs) {
            std::string type{};
            std::int64_t count{};
            verification_session::throw_if_column_error(rs.next_column(type));
            verification_session::throw_if_column_error(rs.next_column(count));
            for (auto candidate : {matching_type::account_id, matching_type::account_group_id, matching_type::skill_code}) {
                if (type == to_string_view(candidate)) {
                    result.matching_counts[candidate] = static_cast<std::size_t>(count);
                    return;
                }
            }
            result.issues.emplace_back("unknown matching type '" + type + "'");
        });
    throw_if_error(transaction->commit(), *connection, "commit");

    auto const accounts = config_.account_count;
    auto const dgs = config_.distribution_group_count;
    expect_exact(result, table_name(entity_type::account, variant), accounts);
    expect_exact(result, table_name(entity_type::account_group, variant), config_.account_group_count);
    expect_exact(result, table_name(entity_type::skill, variant), config_.skill_count);
    expect_exact(result, table_name(entity_type::task, variant), dgs);
    expect_exact(result, dg_table, dgs);
    expect_exact(result, table_name(entity_type::distribution_group_task, variant), dgs);
    expect_exact(result, matching_table, dgs);
    expect_within(result, table_name(entity_type::account_group_link, variant),
                  accounts, accounts * std::min(max_account_groups_per_account, config_.account_group_count));
    expect_within(result, table_name(entity_type::account_skill, variant),
                  accounts, accounts * std::min(max_skills_per_account, config_.skill_count));
    if (result.waiting_count != dgs) {
        result.issues.emplace_back(dg_table + ": " + std::to_string(result.waiting_count) + " groups WAITING, expected " + std::to_string(dgs));
    }
    for (auto type : {matching_type::account_id, matching_type::account_group_id, matching_type::skill_code}) {
        auto actual = result.matching_counts[type];
        auto even = dgs / 3;
        if (actual + 1 < even || even + 1 < actual) {
            result.issues.emplace_back(matching_table + ": " + std::to_string(actual) + " " + std::string(to_string_view(type)) +
                                       " matchings, expected about " + std::to_string(even));
        }
    }

    for (auto const& issue : result.issues) {
        LOG(WARNING) << to_string_view(variant) << " schema: " << issue;
    }
    if (result.ok()) {
        LOG(INFO) << to_string_view(variant) << " schema verified";
    }
    return result;
}

}  // namespace matchbench::dataset
