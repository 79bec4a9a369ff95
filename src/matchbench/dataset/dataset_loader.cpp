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
#include <matchbench/dataset/dataset_loader.h>

#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include <matchbench/exception.h>
#include <matchbench/logging.h>
#include <matchbench/dataset/generators.h>
#include <matchbench/dataset/row_batch_writer.h>

namespace matchbench::dataset {

std::size_t load_result::total_rows() const noexcept {
    std::size_t total = 0;
    for (auto const& [table, count] : row_counts) {
        total += count;
    }
    return total;
}

dataset_loader::dataset_loader(stub::Stub& stub, load_config config)
    : stub_(stub), config_(std::move(config)) {
}

load_result dataset_loader::reload() {
    config_.validate();

    load_result result{};
    result.seed = config_.random_seed ? random_generator::make_seed() : config_.seed;
    LOG(INFO) << "reloading dataset: " << config_.account_count << " accounts, "
              << config_.account_group_count << " account groups, "
              << config_.skill_count << " skills, "
              << config_.distribution_group_count << " distribution groups, seed " << result.seed;

    auto start = std::chrono::steady_clock::now();

    ConnectionPtr connection{};
    if (auto rc = stub_.get_connection(connection); rc != stub::ErrorCode::OK) {
        throw store_error("get_connection", rc);
    }
    TransactionPtr transaction{};
    throw_if_error(connection->begin(transaction), *connection, "begin");

    try {
        truncate(*transaction, *connection);
        for (auto variant : config_.schemas) {
            load(*transaction, *connection, variant, result.seed, result);
        }
        throw_if_error(transaction->commit(), *connection, "commit");
    } catch (exception const& e) {
        LOG(ERROR) << "load aborted, rolling back: " << e.what();
        if (auto rc = transaction->rollback(); rc != stub::ErrorCode::OK && rc != stub::ErrorCode::NO_TRANSACTION) {
            LOG(WARNING) << "rollback failed: " << stub::error_name(rc);
        }
        throw;
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    LOG(INFO) << "dataset loaded: " << result.total_rows() << " rows in "
              << (static_cast<double>(result.elapsed.count()) / 1000.0) << " seconds";
    return result;
}

void dataset_loader::truncate(stub::Transaction& transaction, stub::Connection& connection) {
    std::string statement{"TRUNCATE TABLE "};
    bool first = true;
    for (auto variant : config_.schemas) {
        for (auto entity : truncate_order) {
            if (!first) {
                statement += ", ";
            }
            first = false;
            statement += table_name(entity, variant);
        }
    }
    statement += " RESTART IDENTITY CASCADE";
    VLOG(log_debug) << statement;

    std::size_t num_rows{};
    throw_if_error(transaction.execute_statement(statement, num_rows), connection, "truncate");
}

void dataset_loader::load(stub::Transaction& transaction, stub::Connection& connection, schema_variant variant, std::uint64_t seed, load_result& result) {
    LOG(INFO) << "loading " << to_string_view(variant) << " schema";

    // every schema is generated from the same seed, so that all of them hold the same content
    random_generator rnd{seed};
    references_.clear();
    row_batch_writer writer{transaction, connection, variant, config_.batch_size, config_.progress_interval};
    auto record = [&result, variant](entity_type entity, std::size_t count) {
        result.row_counts[table_name(entity, variant)] = count;
    };

    std::vector<reference_entry> keys{};
    record(entity_type::account, writer.write_batches<account_row>("account", config_.account_count,
        [&keys](std::size_t i, std::vector<account_row>& rows) {
            rows.emplace_back(generate_account(i));
            keys.emplace_back(reference_entry{rows.back().id, {}});
        }));
    references_.populate(entity_type::account, std::move(keys));

    keys = {};
    record(entity_type::account_group, writer.write_batches<account_group_row>("account_group", config_.account_group_count,
        [&keys](std::size_t i, std::vector<account_group_row>& rows) {
            rows.emplace_back(generate_account_group(i));
            keys.emplace_back(reference_entry{rows.back().id, {}});
        }));
    references_.populate(entity_type::account_group, std::move(keys));

    keys = {};
    record(entity_type::skill, writer.write_batches<skill_row>("skill", config_.skill_count,
        [&keys](std::size_t i, std::vector<skill_row>& rows) {
            rows.emplace_back(generate_skill(i));
            keys.emplace_back(reference_entry{rows.back().id, rows.back().code});
        }));
    references_.populate(entity_type::skill, std::move(keys));

    record(entity_type::task, writer.write_batches<task_row>("task", config_.distribution_group_count,
        [](std::size_t i, std::vector<task_row>& rows) {
            rows.emplace_back(generate_task(i));
        }));
    record(entity_type::distribution_group, writer.write_batches<distribution_group_row>("distribution_group", config_.distribution_group_count,
        [](std::size_t i, std::vector<distribution_group_row>& rows) {
            rows.emplace_back(generate_distribution_group(i));
        }));

    auto const& references = references_;
    record(entity_type::account_group_link, writer.write_batches<account_group_link_row>("account_to_account_group", config_.account_count,
        [&references, &rnd](std::size_t i, std::vector<account_group_link_row>& rows) {
            for (auto&& link : generate_account_group_links(i, references, rnd)) {
                rows.emplace_back(std::move(link));
            }
        }));
    record(entity_type::account_skill, writer.write_batches<account_skill_row>("account_skill", config_.account_count,
        [&references, &rnd](std::size_t i, std::vector<account_skill_row>& rows) {
            for (auto&& link : generate_account_skills(i, references, rnd)) {
                rows.emplace_back(std::move(link));
            }
        }));
    record(entity_type::distribution_group_task, writer.write_batches<distribution_group_task_row>("distribution_group_task", config_.distribution_group_count,
        [](std::size_t i, std::vector<distribution_group_task_row>& rows) {
            rows.emplace_back(generate_distribution_group_task(i));
        }));
    record(entity_type::distribution_group_matching, writer.write_batches<distribution_group_matching_row>("distribution_group_matching", config_.distribution_group_count,
        [&references](std::size_t i, std::vector<distribution_group_matching_row>& rows) {
            rows.emplace_back(generate_distribution_group_matching(i, references));
        }));
}

}  // namespace matchbench::dataset
