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
#include <matchbench/benchmark/comparative_report.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <numeric>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/property_tree/json_parser.hpp>

namespace matchbench::benchmark {

double mean(std::vector<double> const& values) {
    if (values.empty()) {
        throw std::invalid_argument("mean of an empty sequence");
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double percentile(std::vector<double> values, double percent) {
    if (values.empty()) {
        throw std::invalid_argument("percentile of an empty sequence");
    }
    if (!(percent > 0.0 && percent <= 100.0)) {
        throw std::invalid_argument("percentile out of range");
    }
    std::sort(values.begin(), values.end());
    // nearest rank
    auto rank = static_cast<std::size_t>(std::ceil(percent / 100.0 * static_cast<double>(values.size())));
    return values.at(std::max<std::size_t>(rank, 1) - 1);
}

double ratio(double numerator, double denominator) noexcept {
    if (denominator == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return numerator / denominator;
}

strategy_statistics const& summary::of(std::string_view strategy) const {
    for (auto const& s : statistics) {
        if (s.strategy == strategy) {
            return s;
        }
    }
    throw std::out_of_range("no statistics for " + std::string(strategy));
}

double summary::ratio(std::string_view numerator, std::string_view denominator) const {
    return benchmark::ratio(of(numerator).mean, of(denominator).mean);
}

summary summarize(std::vector<measurement> const& measurements) {
    summary result{};
    for (auto const& m : measurements) {
        if (m.latencies_ms.empty()) {
            throw std::invalid_argument("no samples for " + m.strategy);
        }
        auto [lo, hi] = std::minmax_element(m.latencies_ms.begin(), m.latencies_ms.end());
        strategy_statistics s{};
        s.strategy = m.strategy;
        s.samples = m.latencies_ms.size();
        s.mean = mean(m.latencies_ms);
        s.min = *lo;
        s.max = *hi;
        s.median = percentile(m.latencies_ms, 50.0);
        s.p95 = percentile(m.latencies_ms, 95.0);
        result.statistics.emplace_back(std::move(s));
    }
    for (auto const& a : result.statistics) {
        for (auto const& b : result.statistics) {
            if (a.strategy != b.strategy) {
                result.comparisons.emplace_back(comparison{a.strategy, b.strategy, ratio(a.mean, b.mean)});
            }
        }
    }
    return result;
}

void print(summary const& s, std::ostream& out) {
    auto const flags = out.flags();
    auto const precision = out.precision();
    out << "=== Performance Summary ===" << std::endl;
    out << std::fixed << std::setprecision(2);
    for (auto const& e : s.statistics) {
        out << e.strategy << ": avg " << e.mean << " ms, min " << e.min << " ms, median " << e.median
            << " ms, p95 " << e.p95 << " ms, max " << e.max << " ms (" << e.samples << " runs)" << std::endl;
    }
    auto const& st = s.statistics;
    for (std::size_t i = 1; i < st.size(); ++i) {
        out << "Improvement (" << st[i - 1].strategy << " -> " << st[i].strategy << "): "
            << ratio(st[i - 1].mean, st[i].mean) << "x faster" << std::endl;
    }
    if (st.size() > 2) {
        out << "Total improvement (" << st.front().strategy << " -> " << st.back().strategy << "): "
            << ratio(st.front().mean, st.back().mean) << "x faster" << std::endl;
    }
    out.flags(flags);
    out.precision(precision);
}

boost::property_tree::ptree to_ptree(summary const& s) {
    boost::property_tree::ptree root{};
    boost::property_tree::ptree strategies{};
    for (auto const& e : s.statistics) {
        boost::property_tree::ptree node{};
        node.put("name", e.strategy);
        node.put("samples", e.samples);
        node.put("mean_ms", e.mean);
        node.put("min_ms", e.min);
        node.put("max_ms", e.max);
        node.put("median_ms", e.median);
        node.put("p95_ms", e.p95);
        strategies.push_back(std::make_pair("", node));
    }
    root.add_child("strategies", strategies);

    boost::property_tree::ptree ratios{};
    for (auto const& c : s.comparisons) {
        boost::property_tree::ptree node{};
        node.put("numerator", c.numerator);
        node.put("denominator", c.denominator);
        node.put("ratio", c.ratio);
        ratios.push_back(std::make_pair("", node));
    }
    root.add_child("ratios", ratios);
    return root;
}

void write_json(summary const& s, std::string const& path) {
    boost::property_tree::write_json(path, to_ptree(s));
}

void write_latency_csv(std::vector<measurement> const& measurements, std::string const& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot open " + path);
    }
    out << "strategy,run,latency_ms" << std::endl;
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (auto const& m : measurements) {
        for (std::size_t i = 0; i < m.latencies_ms.size(); ++i) {
            out << m.strategy << "," << (i + 1) << "," << m.latencies_ms[i] << "\n";
        }
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("failed to write " + path);
    }
}

}  // namespace matchbench::benchmark
