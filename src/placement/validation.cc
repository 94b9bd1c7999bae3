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

#include <rfalter/placement/validation.hh>
#include <rfalter/placement/errors.hh>

#include <unordered_set>

namespace rfalter {

void validate_replication_factor(const std::vector<broker>& brokers, int32_t replication_factor) {
    if (replication_factor <= 0) {
        throw configuration_error("replication factor must be positive");
    }
    std::unordered_set<broker_id> distinct;
    for (const auto& b : brokers) {
        distinct.insert(b.id);
    }
    if (static_cast<size_t>(replication_factor) > distinct.size()) {
        throw configuration_error("replication factor cannot exceed broker count ("
                + std::to_string(replication_factor) + " > " + std::to_string(distinct.size()) + ")");
    }
}

void validate_topology(const std::vector<broker>& brokers, const std::vector<partition_info>& partitions) {
    std::unordered_set<broker_id> known;
    for (const auto& b : brokers) {
        if (!known.insert(b.id).second) {
            throw topology_mismatch("broker " + std::to_string(b.id) + " is listed more than once");
        }
    }

    std::unordered_set<int32_t> seen_partitions;
    for (const auto& p : partitions) {
        if (p.partition < 0) {
            throw topology_mismatch("partition number " + std::to_string(p.partition) + " is negative");
        }
        if (!seen_partitions.insert(p.partition).second) {
            throw topology_mismatch("partition " + std::to_string(p.partition) + " is listed more than once");
        }

        std::unordered_set<broker_id> replicas;
        for (auto replica : p.replicas) {
            if (!known.count(replica)) {
                throw topology_mismatch("partition " + std::to_string(p.partition)
                        + " has a replica on unknown broker " + std::to_string(replica));
            }
            if (!replicas.insert(replica).second) {
                throw topology_mismatch("partition " + std::to_string(p.partition)
                        + " lists broker " + std::to_string(replica) + " twice");
            }
        }
    }
}

}
