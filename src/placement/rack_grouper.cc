/*
 * This file is open source software, licensed to you under the terms
 * of the Apache License, Version 2.0 (the "License").  See the NOTICE file
 * distributed with this work for additional information regarding copyright
 * ownership.  You may not use this file except in compliance with the License.
 *
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

/*
 * Copyright (C) 2019 ScyllaDB Ltd.
 */

#include <rfalter/placement/rack_grouper.hh>

#include <unordered_map>

namespace rfalter {

std::vector<rack_group> group_by_rack(const std::vector<broker>& brokers) {
    std::vector<rack_group> groups;
    std::unordered_map<std::string, size_t> group_index;

    for (const auto& b : brokers) {
        auto it = group_index.find(b.rack);
        if (it == group_index.end()) {
            it = group_index.emplace(b.rack, groups.size()).first;
            groups.push_back(rack_group{b.rack, {}});
        }
        groups[it->second].brokers.push_back(b.id);
    }
    return groups;
}

}
