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
#include <vector>

#include <rfalter/placement/topology.hh>

namespace rfalter {

// Throws configuration_error unless 0 < replication_factor <= number of
// distinct brokers.
void validate_replication_factor(const std::vector<broker>& brokers, int32_t replication_factor);

// Throws topology_mismatch when broker ids repeat, partition numbers are
// negative or repeat, or a replica list repeats a broker or names one that
// is not in `brokers`.
void validate_topology(const std::vector<broker>& brokers, const std::vector<partition_info>& partitions);

}
