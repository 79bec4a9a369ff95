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
#include <matchbench/configuration.h>

#include <string>
#include <utility>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <boost/property_tree/json_parser.hpp>

#include <matchbench/exception.h>
#include <matchbench/logging.h>

DEFINE_string(config, "", "JSON file holding the options, flags given explicitly override it");  // NOLINT
DEFINE_string(connection, "dbname=matchbench", "libpq connection string");  // NOLINT
DEFINE_uint64(pool_size, matchbench::common::param::DEFAULT_POOL_SIZE, "maximum number of store connections");  // NOLINT
DEFINE_uint64(account_count, 100, "number of accounts");  // NOLINT
DEFINE_uint64(account_group_count, 20, "number of account groups");  // NOLINT
DEFINE_uint64(skill_count, 50, "number of skills, at most 90");  // NOLINT
DEFINE_uint64(distribution_group_count, 1000000, "number of distribution groups, also the number of tasks");  // NOLINT
DEFINE_uint64(batch_size, 10000, "rows per insert statement");  // NOLINT
DEFINE_uint64(progress_interval, 10, "batches between progress lines");  // NOLINT
DEFINE_uint64(seed, matchbench::dataset::default_seed, "seed of the random source");  // NOLINT
DEFINE_bool(random_seed, false, "take the seed from std::random_device on every reload, --seed is ignored");  // NOLINT
DEFINE_string(schemas, "both", "schemas to load: base, shadow or both");  // NOLINT
DEFINE_uint64(iterations, 20, "runs per strategy");  // NOLINT
DEFINE_uint64(page_size, 100, "LIMIT of the benchmark queries");  // NOLINT
DEFINE_uint64(offset, 0, "OFFSET of the benchmark queries");  // NOLINT
DEFINE_string(strategies, "left-join,union-all,left-join-indexed,union-all-indexed", "comma separated strategies to measure");  // NOLINT
DEFINE_string(report_json, "", "file the JSON summary is written to");  // NOLINT
DEFINE_string(latency_csv, "", "file the raw latencies are written to");  // NOLINT

namespace matchbench {

namespace {

template <typename T>
void read_option(boost::property_tree::ptree const& tree, char const* key, T& target) {
    try {
        if (auto child = tree.get_child_optional(key)) {
            target = child->get_value<T>();
        }
    } catch (boost::property_tree::ptree_bad_data const& e) {
        throw configuration_error(std::string("invalid value of ") + key + ": " + e.what());
    }
}

bool given(char const* name) {
    return !gflags::GetCommandLineFlagInfoOrDie(name).is_default;
}

std::string join_names(std::vector<benchmark::query_strategy> const& strategies) {
    std::string names{};
    for (auto const& s : strategies) {
        if (!names.empty()) {
            names += ",";
        }
        names += s.name;
    }
    return names;
}

}  // namespace

void benchmark_config::validate() const {
    if (iterations == 0) {
        throw configuration_error("iterations must be greater than 0");
    }
    if (strategies.empty()) {
        throw configuration_error("no strategy selected");
    }
}

void configuration::validate() const {
    if (store.pool_size == 0) {
        throw configuration_error("pool_size must be greater than 0");
    }
    load.validate();
    benchmark.validate();
}

configuration from_ptree(boost::property_tree::ptree const& tree, configuration base) {
    read_option(tree, "connection", base.store.connection);
    read_option(tree, "pool_size", base.store.pool_size);

    auto& load = base.load;
    read_option(tree, "account_count", load.account_count);
    read_option(tree, "account_group_count", load.account_group_count);
    read_option(tree, "skill_count", load.skill_count);
    read_option(tree, "distribution_group_count", load.distribution_group_count);
    read_option(tree, "batch_size", load.batch_size);
    read_option(tree, "progress_interval", load.progress_interval);
    read_option(tree, "seed", load.seed);
    read_option(tree, "random_seed", load.random_seed);
    if (auto schemas = tree.get_optional<std::string>("schemas")) {
        load.schemas = dataset::parse_schemas(*schemas);
    }

    auto& bench = base.benchmark;
    read_option(tree, "iterations", bench.iterations);
    read_option(tree, "page_size", bench.page_size);
    read_option(tree, "offset", bench.offset);
    if (auto strategies = tree.get_optional<std::string>("strategies")) {
        bench.strategies = benchmark::parse_strategies(*strategies);
    }
    read_option(tree, "report_json", bench.report_json);
    read_option(tree, "latency_csv", bench.latency_csv);
    return base;
}

configuration load_configuration_file(std::string const& path, configuration base) {
    boost::property_tree::ptree tree{};
    try {
        boost::property_tree::read_json(path, tree);
    } catch (boost::property_tree::json_parser_error const& e) {
        throw configuration_error("cannot read configuration file " + path + ": " + e.what());
    }
    LOG(INFO) << "configuration read from " << path;
    return from_ptree(tree, std::move(base));
}

configuration configuration_from_flags() {
    configuration c{};
    bool const from_file = !FLAGS_config.empty();
    if (from_file) {
        c = load_configuration_file(FLAGS_config, std::move(c));
    }
    // without a file every flag applies, its default being the default of the option
    auto apply = [from_file](char const* name) { return !from_file || given(name); };

    if (apply("connection")) { c.store.connection = FLAGS_connection; }
    if (apply("pool_size")) { c.store.pool_size = FLAGS_pool_size; }
    if (apply("account_count")) { c.load.account_count = FLAGS_account_count; }
    if (apply("account_group_count")) { c.load.account_group_count = FLAGS_account_group_count; }
    if (apply("skill_count")) { c.load.skill_count = FLAGS_skill_count; }
    if (apply("distribution_group_count")) { c.load.distribution_group_count = FLAGS_distribution_group_count; }
    if (apply("batch_size")) { c.load.batch_size = FLAGS_batch_size; }
    if (apply("progress_interval")) { c.load.progress_interval = FLAGS_progress_interval; }
    if (apply("seed")) { c.load.seed = FLAGS_seed; }
    if (apply("random_seed")) { c.load.random_seed = FLAGS_random_seed; }
    if (apply("schemas")) { c.load.schemas = dataset::parse_schemas(FLAGS_schemas); }
    if (apply("iterations")) { c.benchmark.iterations = FLAGS_iterations; }
    if (apply("page_size")) { c.benchmark.page_size = FLAGS_page_size; }
    if (apply("offset")) { c.benchmark.offset = FLAGS_offset; }
    if (apply("strategies")) { c.benchmark.strategies = benchmark::parse_strategies(FLAGS_strategies); }
    if (apply("report_json")) { c.benchmark.report_json = FLAGS_report_json; }
    if (apply("latency_csv")) { c.benchmark.latency_csv = FLAGS_latency_csv; }

    VLOG(log_debug) << "strategies: " << join_names(c.benchmark.strategies);
    return c;
}

}  // namespace matchbench
