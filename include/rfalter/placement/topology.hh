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

#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace rfalter {

using broker_id = int32_t;

struct broker {
    broker_id id;
    // Empty when the broker does not report a rack.
    std::string rack;
};

struct partition_info {
    int32_t partition;
    // Current replicas, leader first.
    std::vector<broker_id> replicas;
};

struct topic_partition {
    std::string topic;
    int32_t partition;

    bool operator<(const topic_partition& other) const noexcept {
        return std::tie(topic, partition) < std::tie(other.topic, other.partition);
    }

    bool operator==(const topic_partition& other) const noexcept {
        return topic == other.topic && partition == other.partition;
    }
};

using broker_ordering = std::vector<broker_id>;

// Target replica list of every partition of a topic.
using reassignment = std::map<topic_partition, std::vector<broker_id>>;

}
