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

#include <string>
#include <vector>

#include <glog/logging.h>

#include <matchbench/exception.h>
#include <matchbench/mock/database_mock.h>
#include <matchbench/dataset/row_batch_writer.h>
#include <matchbench/dataset/generators.h>

namespace matchbench::testing {

using namespace matchbench::dataset;
using mock::database_mock;

// keeps the progress lines of the batch writer
class progress_sink : public google::LogSink {
public:
    void send(google::LogSeverity, const char*, const char*, int, const struct ::tm*,
              const char* message, size_t message_len) override {
        std::string line(message, message_len);
        if (line.find("rows written") != std::string::npos) {
            lines_.emplace_back(std::move(line));
        }
    }
    [[nodiscard]] std::vector<std::string> const& lines() const noexcept { return lines_; }

private:
    std::vector<std::string> lines_{};
};

class RowBatchWriterTest : public ::testing::Test {
    void SetUp() override {
        database_mock::instance().reset();
        ASSERT_EQ(ERROR_CODE::OK, make_stub(stub_));
        ASSERT_EQ(ERROR_CODE::OK, stub_->get_connection(connection_));
        ASSERT_EQ(ERROR_CODE::OK, connection_->begin(transaction_));
    }
    void TearDown() override {
        transaction_.reset();
        connection_.reset();
        stub_.reset();
        database_mock::instance().reset();
    }
protected:
    StubPtr stub_{};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes,misc-non-private-member-variables-in-classes)
    ConnectionPtr connection_{};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes,misc-non-private-member-variables-in-classes)
    TransactionPtr transaction_{};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes,misc-non-private-member-variables-in-classes)
};

TEST_F(RowBatchWriterTest, insert_statement) {
    EXPECT_EQ("INSERT INTO task (id) VALUES ($1), ($2)", insert_statement<task_row>(schema_variant::base, 2));
    EXPECT_EQ("INSERT INTO account_2 (id, name) VALUES ($1, $2)", insert_statement<account_row>(schema_variant::shadow, 1));
}

TEST_F(RowBatchWriterTest, batches) {
    row_batch_writer writer{*transaction_, *connection_, schema_variant::base, 10, 2};
    auto written = writer.write_batches<task_row>("task", 25, [](std::size_t i, std::vector<task_row>& rows) {
        rows.emplace_back(generate_task(i));
    });
    EXPECT_EQ(25U, written);
    ASSERT_EQ(ERROR_CODE::OK, transaction_->commit());

    auto& db = database_mock::instance();
    EXPECT_EQ(3U, db.count_statements("INSERT INTO task "));
    EXPECT_EQ(25U, db.row_count("task"));
    auto ids = db.column("task", "id");
    EXPECT_EQ(std::int64_t{1}, std::get<std::int64_t>(ids.front()));
    EXPECT_EQ(std::int64_t{25}, std::get<std::int64_t>(ids.back()));
}

TEST_F(RowBatchWriterTest, progress_every_interval) {
    progress_sink sink{};
    google::AddLogSink(&sink);
    row_batch_writer writer{*transaction_, *connection_, schema_variant::base, 10, 2};
    auto written = writer.write_batches<task_row>("task", 55, [](std::size_t i, std::vector<task_row>& rows) {
        rows.emplace_back(generate_task(i));
    });
    google::RemoveLogSink(&sink);

    EXPECT_EQ(55U, written);
    EXPECT_EQ(6U, database_mock::instance().count_statements("INSERT INTO task "));
    ASSERT_EQ(3U, sink.lines().size());
    EXPECT_NE(std::string::npos, sink.lines()[0].find("task: 20 rows written (20/55)"));
    EXPECT_NE(std::string::npos, sink.lines()[1].find("task: 40 rows written (40/55)"));
    EXPECT_NE(std::string::npos, sink.lines()[2].find("task: 55 rows written (55/55)"));
}

TEST_F(RowBatchWriterTest, batch_closes_after_the_index_that_fills_it) {
    row_batch_writer writer{*transaction_, *connection_, schema_variant::base, 4, 10};
    // three rows per index
    auto written = writer.write_batches<task_row>("task", 4, [](std::size_t i, std::vector<task_row>& rows) {
        for (std::size_t k = 0; k < 3; ++k) {
            rows.emplace_back(generate_task(i * 3 + k));
        }
    });
    EXPECT_EQ(12U, written);
    auto const& journal = database_mock::instance().journal();
    std::vector<std::size_t> parameter_counts{};
    for (auto const& e : journal) {
        if (e.sql.rfind("INSERT", 0) == 0) {
            parameter_counts.emplace_back(e.parameter_count);
        }
    }
    EXPECT_EQ((std::vector<std::size_t>{6, 6}), parameter_counts);
}

TEST_F(RowBatchWriterTest, empty) {
    row_batch_writer writer{*transaction_, *connection_, schema_variant::base, 10, 1};
    auto written = writer.write_batches<task_row>("task", 0, [](std::size_t i, std::vector<task_row>& rows) {
        rows.emplace_back(generate_task(i));
    });
    EXPECT_EQ(0U, written);
    EXPECT_EQ(0U, database_mock::instance().count_statements("INSERT"));
}

TEST_F(RowBatchWriterTest, rejected_batch) {
    database_mock::instance().fail_when("INSERT INTO account ", ERROR_CODE::SERVER_ERROR, "23505", "duplicate key value violates unique constraint");
    row_batch_writer writer{*transaction_, *connection_, schema_variant::base, 10, 1};
    try {
        writer.write_batches<account_row>("account", 5, [](std::size_t i, std::vector<account_row>& rows) {
            rows.emplace_back(generate_account(i));
        });
        FAIL() << "store_error expected";
    } catch (store_error const& e) {
        EXPECT_EQ(ERROR_CODE::SERVER_ERROR, e.code());
        EXPECT_EQ("23505", e.info().sql_state);
    }
}

TEST_F(RowBatchWriterTest, row_count_mismatch) {
    database_mock::instance().misreport_row_count(3);
    row_batch_writer writer{*transaction_, *connection_, schema_variant::base, 10, 1};
    EXPECT_THROW(writer.write_batches<account_row>("account", 5, [](std::size_t i, std::vector<account_row>& rows) {
        rows.emplace_back(generate_account(i));
    }), store_error);
}

}  // namespace matchbench::testing
