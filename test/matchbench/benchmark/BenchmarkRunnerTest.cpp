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

#include <matchbench/exception.h>
#include <matchbench/mock/database_mock.h>
#include <matchbench/benchmark/benchmark_runner.h>

namespace matchbench::testing {

using namespace matchbench::benchmark;
using mock::database_mock;

class BenchmarkRunnerTest : public ::testing::Test {
    void SetUp() override {
        database_mock::instance().reset();
        ASSERT_EQ(ERROR_CODE::OK, make_stub(stub_));
    }
    void TearDown() override {
        stub_.reset();
        database_mock::instance().reset();
    }
protected:
    StubPtr stub_{};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes,misc-non-private-member-variables-in-classes)

    // answers every query with rows_per_page waiting groups, recording the bound parameters
    void answer(std::size_t rows_per_page, std::vector<stub::parameters_type>& bound) {
        database_mock::instance().set_query_handler(
            [rows_per_page, &bound](std::string_view, stub::parameters_type const& parameters, mock::tables_type const&) {
                bound.emplace_back(parameters);
                mock::query_result result{};
                for (std::size_t i = 0; i < rows_per_page; ++i) {
                    result.rows.emplace_back(std::vector<stub::value_type>{
                        stub::value_type{static_cast<std::int64_t>(i + 1)}, stub::value_type{std::string("WAITING")}});
                }
                return std::optional<mock::query_result>{std::move(result)};
            });
    }
};

TEST_F(BenchmarkRunnerTest, measure) {
    std::vector<stub::parameters_type> bound{};
    answer(100, bound);

    benchmark_runner runner{*stub_};
    auto strategy = default_strategies().at(1);
    auto result = runner.measure(strategy, 100, 0, 20);

    EXPECT_EQ("union-all", result.strategy);
    ASSERT_EQ(20U, result.latencies_ms.size());
    for (auto ms : result.latencies_ms) {
        EXPECT_GE(ms, 0.0);
    }
    EXPECT_EQ(100U, result.first_row_count);

    ASSERT_EQ(20U, bound.size());
    ASSERT_EQ(2U, bound[0].size());
    EXPECT_EQ(std::int64_t{100}, std::get<std::int64_t>(bound[0][0]));
    EXPECT_EQ(std::int64_t{0}, std::get<std::int64_t>(bound[0][1]));

    auto& db = database_mock::instance();
    EXPECT_EQ(20U, db.count_statements("BEGIN"));
    EXPECT_EQ(20U, db.count_statements("COMMIT"));
    EXPECT_EQ(20U, db.count_statements(strategy.sql()));
}

TEST_F(BenchmarkRunnerTest, offset) {
    std::vector<stub::parameters_type> bound{};
    answer(10, bound);

    benchmark_runner runner{*stub_};
    auto result = runner.measure(default_strategies().at(0), 10, 500, 3);
    EXPECT_EQ(3U, result.latencies_ms.size());
    EXPECT_EQ(10U, result.first_row_count);
    EXPECT_EQ(std::int64_t{500}, std::get<std::int64_t>(bound.back()[1]));
}

TEST_F(BenchmarkRunnerTest, larger_than_page) {
    std::vector<stub::parameters_type> bound{};
    answer(150, bound);

    benchmark_runner runner{*stub_};
    auto result = runner.measure(default_strategies().at(0), 100, 0, 2);
    EXPECT_EQ(150U, result.first_row_count);
    EXPECT_EQ(2U, result.latencies_ms.size());
}

TEST_F(BenchmarkRunnerTest, store_failure) {
    database_mock::instance().fail_when("UNION ALL", ERROR_CODE::SERVER_ERROR, "57014", "canceling statement due to statement timeout");

    benchmark_runner runner{*stub_};
    try {
        (void) runner.measure(default_strategies().at(1), 100, 0, 5);
        FAIL() << "store_error expected";
    } catch (store_error const& e) {
        EXPECT_EQ("57014", e.info().sql_state);
    }
    EXPECT_EQ(0U, database_mock::instance().count_statements("COMMIT"));
}

TEST_F(BenchmarkRunnerTest, invalid_arguments) {
    benchmark_runner runner{*stub_};
    EXPECT_THROW((void) runner.measure(default_strategies().at(0), 100, 0, 0), configuration_error);
}

TEST_F(BenchmarkRunnerTest, empty_page) {
    std::vector<stub::parameters_type> bound{};
    answer(0, bound);

    benchmark_runner runner{*stub_};
    auto result = runner.measure(default_strategies().at(0), 0, 0, 4);
    EXPECT_EQ(0U, result.first_row_count);
    EXPECT_EQ(4U, result.latencies_ms.size());
    ASSERT_EQ(4U, bound.size());
    EXPECT_EQ(std::int64_t{0}, std::get<std::int64_t>(bound[0][0]));
}

}  // namespace matchbench::testing
