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

#include <cstdlib>
#include <iostream>
#include <string>

#include <matchbench/dataset/dataset_loader.h>
#include <matchbench/dataset/dataset_verifier.h>
#include <matchbench/benchmark/benchmark_runner.h>
#include <matchbench/benchmark/comparative_report.h>

namespace matchbench::testing {

/**
 * @brief the full scenario against a PostgreSQL holding the tables of sql/schema.sql.
 * @details set MATCHBENCH_TEST_CONNECTION to a libpq connection string to run it.
 */
class EndToEndTest : public ::testing::Test {
    void SetUp() override {
        const char* conninfo = std::getenv("MATCHBENCH_TEST_CONNECTION");
        if (conninfo == nullptr || *conninfo == '\0') {
            GTEST_SKIP() << "MATCHBENCH_TEST_CONNECTION is not set";
        }
        ASSERT_EQ(ERROR_CODE::OK, make_stub(stub_, conninfo));
    }
protected:
    StubPtr stub_{};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes,misc-non-private-member-variables-in-classes)
};

TEST_F(EndToEndTest, load_verify_and_measure) {
    dataset::load_config config{};
    config.account_count = 100;
    config.account_group_count = 20;
    config.skill_count = 50;
    config.distribution_group_count = 1000000;
    config.batch_size = 10000;

    dataset::dataset_loader loader{*stub_, config};
    auto loaded = loader.reload();
    EXPECT_EQ(1000000U, loaded.row_counts.at("distribution_group"));
    EXPECT_EQ(1000000U, loaded.row_counts.at("distribution_group_matching_2"));

    dataset::dataset_verifier verifier{*stub_, config};
    for (auto variant : config.schemas) {
        auto result = verifier.verify(variant);
        ASSERT_TRUE(result.ok()) << result.issues.front();
        EXPECT_EQ(333334U, result.matching_counts[dataset::matching_type::account_id]);
        EXPECT_EQ(333333U, result.matching_counts[dataset::matching_type::account_group_id]);
        EXPECT_EQ(333333U, result.matching_counts[dataset::matching_type::skill_code]);
    }

    benchmark::benchmark_runner runner{*stub_};
    std::vector<benchmark::measurement> measurements{};
    for (auto const& strategy : benchmark::default_strategies()) {
        auto m = runner.measure(strategy, 100, 0, 20);
        EXPECT_EQ(20U, m.latencies_ms.size());
        EXPECT_LE(m.first_row_count, 100U);
        EXPECT_GT(m.first_row_count, 0U);
        measurements.emplace_back(std::move(m));
    }
    auto summary = benchmark::summarize(measurements);
    EXPECT_EQ(12U, summary.comparisons.size());
    benchmark::print(summary, std::cout);

    // a second reload produces the same shape
    auto reloaded = loader.reload();
    EXPECT_EQ(loaded.row_counts.at("task"), reloaded.row_counts.at("task"));
    EXPECT_TRUE(verifier.verify(dataset::schema_variant::base).ok());
}

}  // namespace matchbench::testing
