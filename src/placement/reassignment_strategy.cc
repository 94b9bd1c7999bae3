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

#include <rfalter/placement/reassignment_strategy.hh>
#include <rfalter/placement/errors.hh>
#include <rfalter/placement/interleaver.hh>
#include <rfalter/placement/rotation_window.hh>
#include <rfalter/placement/validation.hh>

#include <algorithm>

namespace rfalter {

round_robin_across_racks_strategy::round_robin_across_racks_strategy(std::string topic,
        const std::vector<broker>& brokers, std::vector<partition_info> partitions, int32_t replication_factor)
    : _topic(std::move(topic)),
    _partitions(std::move(partitions)),
    _rack_alternating_brokers(rack_alternating_order(brokers)),
    _replication_factor(static_cast<size_t>(replication_factor)) {}

reassignment round_robin_across_racks_strategy::reassignments() const {
    reassignment result;
    for (const auto& p : _partitions) {
        result.emplace(topic_partition{_topic, p.partition},
                rotation(_rack_alternating_brokers, static_cast<size_t>(p.partition), _replication_factor));
    }
    return result;
}

namespace strategies {

const std::vector<std::string>& names() {
    static const std::vector<std::string> registered {ROUND_ROBIN_ACROSS_RACKS};
    return registered;
}

}

std::unique_ptr<reassignment_strategy> make_reassignment_strategy(const std::string& name,
        std::string topic, const std::vector<broker>& brokers,
        std::vector<partition_info> partitions, int32_t replication_factor) {
    const auto& known = strategies::names();
    if (std::find(known.begin(), known.end(), name) == known.end()) {
        std::string available;
        for (const auto& k : known) {
            available += (available.empty() ? "" : ", ") + k;
        }
        throw configuration_error("unknown reassignment strategy '" + name + "', available: " + available);
    }
    validate_replication_factor(brokers, replication_factor);
    validate_topology(brokers, partitions);
    return std::make_unique<round_robin_across_racks_strategy>(std::move(topic), brokers,
            std::move(partitions), replication_factor);
}

}
