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

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <matchbench/configuration.h>
#include <matchbench/exception.h>
#include <matchbench/dataset/dataset_loader.h>
#include <matchbench/dataset/dataset_verifier.h>

int main(int argc, char **argv) {
    gflags::SetUsageMessage("regenerates the matchbench dataset: truncates the tables and loads them again");
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

        matchbench::dataset::dataset_loader loader{*stub, config.load};
        auto result = loader.reload();
        std::cout << "seed: " << result.seed << std::endl;
        for (auto const& [table, count] : result.row_counts) {
            std::cout << table << ": " << count << std::endl;
        }
        std::cout << "completed in " << (static_cast<double>(result.elapsed.count()) / 1000.0) << " seconds" << std::endl;

        matchbench::dataset::dataset_verifier verifier{*stub, config.load};
        bool ok = true;
        for (auto variant : config.load.schemas) {
            ok = verifier.verify(variant).ok() && ok;
        }
        return ok ? 0 : 2;
    } catch (matchbench::exception const& e) {
        LOG(ERROR) << e.what();
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
