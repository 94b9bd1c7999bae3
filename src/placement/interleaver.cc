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

#include <rfalter/placement/interleaver.hh>
#include <rfalter/placement/rack_grouper.hh>

namespace rfalter {

broker_ordering rack_alternating_order(const std::vector<broker>& brokers) {
    auto groups = group_by_rack(brokers);

    std::vector<std::vector<broker_id>> split_by_rack;
    split_by_rack.reserve(groups.size());
    for (auto& group : groups) {
        split_by_rack.push_back(std::move(group.brokers));
    }
    return interleave(split_by_rack);
}

}
