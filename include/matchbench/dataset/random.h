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
#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace matchbench::dataset {

/**
 * @brief pseudo random source threaded through the generators, seeded once per load.
 */
class random_generator {
public:
    explicit random_generator(std::uint64_t seed) : seed_(seed), mt_(seed) {}

    /**
     * @brief a seed taken from std::random_device, never zero.
     */
    static std::uint64_t make_seed() {
        std::random_device rnd;
        std::uint64_t seed{};
        do {
            seed = (static_cast<std::uint64_t>(rnd()) << 32U) | rnd();
        } while (seed == 0);
        return seed;
    }

    [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

    std::size_t uniform_within(std::size_t low, std::size_t high)
    {
        std::uniform_int_distribution<std::size_t> randlh(low, high);
        return randlh(mt_);
    }

    /**
     * @brief choose k distinct positions out of [0, population) in random order.
     */
    std::vector<std::size_t> choose_distinct(std::size_t population, std::size_t k)
    {
        std::vector<std::size_t> positions(population);
        for (std::size_t i = 0; i < population; ++i) {
            positions[i] = i;
        }
        // partial Fisher-Yates
        for (std::size_t i = 0; i < k && i < population; ++i) {
            std::swap(positions[i], positions[uniform_within(i, population - 1)]);
        }
        positions.resize(k < population ? k : population);
        return positions;
    }

private:
    std::uint64_t seed_;
    std::mt19937_64 mt_;
};

}  // namespace matchbench::dataset
