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
#include <iostream>
#include <set>
#include <stdexcept>
#include <vector>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <matchbench/configuration.h>
#include <matchbench/exception.h>
#include <matchbench/dataset/dataset_verifier.h>
#include <matchbench/benchmark/benchmark_runner.h>
#include <matchbench/benchmark/comparative_report.h>

int main(int argc, char **argv) {
    gflags::SetUsageMessage("measures the query strategies against a loaded matchbench dataset");
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    google::InitGoogleLogging(argv[0]);  // NOLINT

    try {
        auto config = matchbench::configuration_from_flags();
        config.validate();

        StubPtr stub;
        if (auto err = make_stub(stub, config.store.connection, config.store.pool_size); err != ERROR_CODE::OK) {
            std::cerr << "cannot create the stub, error was " << matchbench::stub::error_name(err) << std::endl;
            return 1;
        }

        // a partial dataset gives meaningless numbers
        std::set<matchbench::dataset::schema_variant> variants{};
        for (auto const& s : config.benchmark.strategies) {
            variants.insert(s.variant);
        }
        matchbench::dataset::dataset_verifier verifier{*stub, config.load};
        for (auto variant : variants) {
            if (!verifier.verify(variant).ok()) {
                std::cerr << "the " << matchbench::dataset::to_string_view(variant)
                          << " schema does not hold a complete dataset, run matchbench-loader first" << std::endl;
                return 2;
            }
        }

        matchbench::benchmark::benchmark_runner runner{*stub};
        std::vector<matchbench::benchmark::measurement> measurements{};
        auto const& bench = config.benchmark;
        for (auto const& strategy : bench.strategies) {
            measurements.emplace_back(runner.measure(strategy, bench.page_size, bench.offset, bench.iterations));
        }

        auto summary = matchbench::benchmark::summarize(measurements);
        matchbench::benchmark::print(summary, std::cout);
        if (!bench.report_json.empty()) {
            matchbench::benchmark::write_json(summary, bench.report_json);
            LOG(INFO) << "summary written to " << bench.report_json;
        }
        if (!bench.latency_csv.empty()) {
            matchbench::benchmark::write_latency_csv(measurements, bench.latency_csv);
            LOG(INFO) << "latencies written to " << bench.latency_csv;
        }
        return 0;
    } catch (matchbench::exception const& e) {
        LOG(ERROR) << e.what();
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    } catch (std::runtime_error const& e) {
        // report files
        LOG(ERROR) << e.what();
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
