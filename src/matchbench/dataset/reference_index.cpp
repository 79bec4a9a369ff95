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
#include <matchbench/dataset/reference_index.h>

#include <string>
#include <utility>

#include <glog/logging.h>

#include <matchbench/exception.h>
#include <matchbench/logging.h>

namespace matchbench::dataset {

void reference_index::populate(entity_type entity, std::vector<reference_entry> entries) {
    if (contains(entity)) {
        throw dependency_error("reference index already holds " + std::string(to_string_view(entity)));
    }
    VLOG(log_debug) << "reference index: " << to_string_view(entity) << " " << entries.size() << " keys";
    entries_.emplace(entity, std::move(entries));
}

std::vector<reference_entry> const& reference_index::resolve(entity_type entity) const {
    auto it = entries_.find(entity);
    if (it == entries_.end()) {
        throw dependency_error(std::string(to_string_view(entity)) + " has not been loaded yet");
    }
    if (it->second.empty()) {
        throw dependency_error(std::string(to_string_view(entity)) + " has no rows to refer to");
    }
    return it->second;
}

bool reference_index::contains(entity_type entity) const noexcept {
    return entries_.find(entity) != entries_.end();
}

void reference_index::clear() noexcept {
    entries_.clear();
}

}  // namespace matchbench::dataset
