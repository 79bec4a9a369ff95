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
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>

#include <gflags/gflags.h>
#include <boost/property_tree/json_parser.hpp>

#include <matchbench/configuration.h>
#include <matchbench/exception.h>

namespace matchbench::testing {

class ConfigurationTest : public ::testing::Test {
    void SetUp() override {
        saver_ = std::make_unique<gflags::FlagSaver>();
    }
    void TearDown() override {
        saver_.reset();
    }
    std::unique_ptr<gflags::FlagSaver> saver_{};

protected:
    static boost::property_tree::ptree parse(std::string const& json) {
        std::istringstream in{json};
        boost::property_tree::ptree tree{};
        boost::property_tree::read_json(in, tree);
        return tree;
    }
};

TEST_F(ConfigurationTest, defaults) {
    configuration c{};
    EXPECT_EQ("dbname=matchbench", c.store.connection);
    EXPECT_EQ(2U, c.store.pool_size);
    EXPECT_EQ(100U, c.load.account_count);
    EXPECT_EQ(20U, c.load.account_group_count);
    EXPECT_EQ(50U, c.load.skill_count);
    EXPECT_EQ(1000000U, c.load.distribution_group_count);
    EXPECT_EQ(10000U, c.load.batch_size);
    EXPECT_EQ(10U, c.load.progress_interval);
    EXPECT_EQ(dataset::default_seed, c.load.seed);
    EXPECT_FALSE(c.load.random_seed);
    EXPECT_EQ(2U, c.load.schemas.size());
    EXPECT_EQ(20U, c.benchmark.iterations);
    EXPECT_EQ(100U, c.benchmark.page_size);
    EXPECT_EQ(0U, c.benchmark.offset);
    EXPECT_EQ(4U, c.benchmark.strategies.size());
    EXPECT_NO_THROW(c.validate());
}

TEST_F(ConfigurationTest, from_ptree) {
    auto c = from_ptree(parse(R"({"account_count": 10, "skill_count": 90, "schemas": "shadow",
        "strategies": "union-all-indexed", "iterations": 5, "connection": "host=db dbname=bench", "seed": 7, "random_seed": true})"));
    EXPECT_EQ(10U, c.load.account_count);
    EXPECT_EQ(90U, c.load.skill_count);
    EXPECT_EQ(20U, c.load.account_group_count);
    ASSERT_EQ(1U, c.load.schemas.size());
    EXPECT_EQ(dataset::schema_variant::shadow, c.load.schemas[0]);
    ASSERT_EQ(1U, c.benchmark.strategies.size());
    EXPECT_EQ("union-all-indexed", c.benchmark.strategies[0].name);
    EXPECT_EQ(5U, c.benchmark.iterations);
    EXPECT_EQ("host=db dbname=bench", c.store.connection);
    EXPECT_EQ(7U, c.load.seed);
    EXPECT_TRUE(c.load.random_seed);
}

TEST_F(ConfigurationTest, invalid_values) {
    EXPECT_THROW(from_ptree(parse(R"({"account_count": "many"})")), configuration_error);
    EXPECT_THROW(from_ptree(parse(R"({"schemas": "all"})")), configuration_error);
    EXPECT_THROW(from_ptree(parse(R"({"strategies": "hash-join"})")), configuration_error);
    EXPECT_THROW(load_configuration_file("/nonexistent/matchbench.json"), configuration_error);

    configuration c{};
    c.store.pool_size = 0;
    EXPECT_THROW(c.validate(), configuration_error);
    c = configuration{};
    c.benchmark.iterations = 0;
    EXPECT_THROW(c.validate(), configuration_error);
    c = configuration{};
    c.load.skill_count = 91;
    EXPECT_THROW(c.validate(), configuration_error);
}

TEST_F(ConfigurationTest, empty_page) {
    configuration c{};
    c.benchmark.page_size = 0;
    c.benchmark.offset = 0;
    EXPECT_NO_THROW(c.validate());
}

TEST_F(ConfigurationTest, flags) {
    gflags::SetCommandLineOption("distribution_group_count", "5000");
    gflags::SetCommandLineOption("strategies", "left-join,union-all");
    auto c = configuration_from_flags();
    EXPECT_EQ(5000U, c.load.distribution_group_count);
    EXPECT_EQ(2U, c.benchmark.strategies.size());
    EXPECT_EQ(100U, c.load.account_count);
}

TEST_F(ConfigurationTest, flags_override_file) {
    auto path = ::testing::TempDir() + "matchbench_config.json";
    {
        std::ofstream out(path);
        out << R"({"account_count": 300, "batch_size": 500, "iterations": 3})";
    }
    gflags::SetCommandLineOption("config", path.c_str());
    gflags::SetCommandLineOption("batch_size", "800");
    auto c = configuration_from_flags();
    EXPECT_EQ(300U, c.load.account_count);
    EXPECT_EQ(800U, c.load.batch_size);
    EXPECT_EQ(3U, c.benchmark.iterations);
    EXPECT_EQ(100U, c.benchmark.page_size);
    std::remove(path.c_str());
}

}  // namespace matchbench::testing
