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

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <rfalter/placement/topology.hh>

namespace rfalter {

// Produces a new replica list for every current partition of a topic.
// Implementations are built from one topology snapshot and must not
// add or drop partitions.
class reassignment_strategy {
public:
    virtual reassignment reassignments() const = 0;
    virtual ~reassignment_strategy() = default;
};

// Phase-shifted windows over one rack-alternating broker ordering:
// partition p gets ordering[p], ordering[p+1], ... (mod N).
// The replication factor must already be validated against the brokers.
class round_robin_across_racks_strategy final : public reassignment_strategy {
private:
    std::string _topic;
    std::vector<partition_info> _partitions;
    broker_ordering _rack_alternating_brokers;
    size_t _replication_factor;

public:
    round_robin_across_racks_strategy(std::string topic, const std::vector<broker>& brokers,
            std::vector<partition_info> partitions, int32_t replication_factor);

    reassignment reassignments() const override;
};

namespace strategies {

constexpr char ROUND_ROBIN_ACROSS_RACKS[] = "round-robin-across-racks";

const std::vector<std::string>& names();

}

// Validates the request and builds the strategy registered under `name`.
// Throws configuration_error or topology_mismatch; nothing is computed
// when validation fails.
std::unique_ptr<reassignment_strategy> make_reassignment_strategy(const std::string& name,
        std::string topic, const std::vector<broker>& brokers,
        std::vector<partition_info> partitions, int32_t replication_factor);

}
