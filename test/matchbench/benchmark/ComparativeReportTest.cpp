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

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <boost/property_tree/json_parser.hpp>

#include <matchbench/benchmark/comparative_report.h>

namespace matchbench::testing {

using namespace matchbench::benchmark;

class ComparativeReportTest : public ::testing::Test {
protected:
    static measurement make(std::string name, std::vector<double> latencies) {
        measurement m{};
        m.strategy = std::move(name);
        m.latencies_ms = std::move(latencies);
        m.first_row_count = 100;
        return m;
    }
};

TEST_F(ComparativeReportTest, ratio_of_means) {
    auto s = summarize({make("left-join", {300.0, 400.0, 350.0}), make("union-all", {1.0, 3.0, 2.0})});
    EXPECT_DOUBLE_EQ(350.0, s.of("left-join").mean);
    EXPECT_DOUBLE_EQ(2.0, s.of("union-all").mean);
    EXPECT_DOUBLE_EQ(175.0, s.ratio("left-join", "union-all"));
    EXPECT_DOUBLE_EQ(2.0 / 350.0, s.ratio("union-all", "left-join"));
    ASSERT_EQ(2U, s.comparisons.size());
}

TEST_F(ComparativeReportTest, every_ordered_pair) {
    auto s = summarize({make("a", {1.0}), make("b", {2.0}), make("c", {4.0})});
    EXPECT_EQ(6U, s.comparisons.size());
    EXPECT_DOUBLE_EQ(4.0, s.ratio("c", "a"));
    EXPECT_THROW((void) s.of("d"), std::out_of_range);
}

TEST_F(ComparativeReportTest, order_statistics) {
    std::vector<double> samples{};
    for (int i = 20; i >= 1; --i) {
        samples.emplace_back(static_cast<double>(i));
    }
    auto s = summarize({make("left-join", samples)});
    auto const& st = s.of("left-join");
    EXPECT_EQ(20U, st.samples);
    EXPECT_DOUBLE_EQ(10.5, st.mean);
    EXPECT_DOUBLE_EQ(1.0, st.min);
    EXPECT_DOUBLE_EQ(20.0, st.max);
    EXPECT_DOUBLE_EQ(10.0, st.median);
    EXPECT_DOUBLE_EQ(19.0, st.p95);
}

TEST_F(ComparativeReportTest, zero_denominator) {
    EXPECT_TRUE(std::isinf(ratio(5.0, 0.0)));
    auto s = summarize({make("slow", {5.0}), make("instant", {0.0, 0.0})});
    EXPECT_TRUE(std::isinf(s.ratio("slow", "instant")));
    EXPECT_DOUBLE_EQ(0.0, s.ratio("instant", "slow"));
}

TEST_F(ComparativeReportTest, empty_sequence) {
    EXPECT_THROW((void) mean({}), std::invalid_argument);
    EXPECT_THROW((void) summarize({make("left-join", {})}), std::invalid_argument);
}

TEST_F(ComparativeReportTest, print) {
    auto s = summarize({make("left-join", {350.0}), make("union-all", {35.0}), make("union-all-indexed", {2.0})});
    std::ostringstream out{};
    print(s, out);
    auto text = out.str();
    EXPECT_NE(std::string::npos, text.find("left-join: avg 350.00 ms"));
    EXPECT_NE(std::string::npos, text.find("Improvement (left-join -> union-all): 10.00x faster"));
    EXPECT_NE(std::string::npos, text.find("Improvement (union-all -> union-all-indexed): 17.50x faster"));
    EXPECT_NE(std::string::npos, text.find("Total improvement (left-join -> union-all-indexed): 175.00x faster"));
}

TEST_F(ComparativeReportTest, print_keeps_stream_format) {
    auto s = summarize({make("left-join", {350.0}), make("union-all", {2.0})});
    std::ostringstream out{};
    out.precision(9);
    auto const flags = out.flags();
    print(s, out);
    EXPECT_EQ(9, out.precision());
    EXPECT_EQ(flags, out.flags());

    std::ostringstream after{};
    after.copyfmt(out);
    after << 3.14159265;
    EXPECT_EQ("3.14159265", after.str());
}

TEST_F(ComparativeReportTest, json) {
    auto s = summarize({make("left-join", {350.0}), make("union-all", {2.0})});
    auto tree = to_ptree(s);
    auto const& strategies = tree.get_child("strategies");
    ASSERT_EQ(2U, strategies.size());
    EXPECT_EQ("left-join", strategies.begin()->second.get<std::string>("name"));
    EXPECT_DOUBLE_EQ(350.0, strategies.begin()->second.get<double>("mean_ms"));
    EXPECT_EQ(2U, tree.get_child("ratios").size());

    auto path = ::testing::TempDir() + "matchbench_report.json";
    write_json(s, path);
    boost::property_tree::ptree read{};
    boost::property_tree::read_json(path, read);
    EXPECT_DOUBLE_EQ(175.0, read.get_child("ratios").begin()->second.get<double>("ratio"));
    std::remove(path.c_str());
}

TEST_F(ComparativeReportTest, latency_csv) {
    auto path = ::testing::TempDir() + "matchbench_latency.csv";
    write_latency_csv({make("left-join", {1.5, 2.5}), make("union-all", {0.5})}, path);

    std::ifstream in(path);
    std::vector<std::string> lines{};
    for (std::string line; std::getline(in, line);) {
        lines.emplace_back(line);
    }
    ASSERT_EQ(4U, lines.size());
    EXPECT_EQ("strategy,run,latency_ms", lines[0]);
    EXPECT_EQ("left-join,1,1.5", lines[1]);
    EXPECT_EQ("left-join,2,2.5", lines[2]);
    EXPECT_EQ("union-all,1,0.5", lines[3]);
    std::remove(path.c_str());

    EXPECT_THROW(write_latency_csv({}, "/nonexistent/dir/latency.csv"), std::runtime_error);
}

}  // namespace matchbench::testing
