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

#include <string>
#include <vector>

#include <seastar/core/future.hh>
#include <seastar/util/bool_class.hh>

#include <rfalter/admin/cluster_gateway.hh>
#include <rfalter/placement/reassignment_strategy.hh>

using namespace seastar;

namespace rfalter {

struct dry_run_tag {};
using dry_run = seastar::bool_class<dry_run_tag>;

struct alter_request {
    std::string topic;
    int32_t replication_factor = 1;
    std::string strategy = strategies::ROUND_ROBIN_ACROSS_RACKS;
    dry_run dry_run_enabled = dry_run::no;
};

struct alter_result {
    std::vector<partition_info> current;
    reassignment proposed;
    // false for dry runs and for topics without partitions
    bool submitted = false;
};

// Fetches the topology, validates the request before any partition data is
// read, computes the placement and submits it unless this is a dry run.
// Fails with configuration_error, topology_mismatch or cluster_exception.
future<alter_result> alter_replication_factor(cluster_gateway& gateway, alter_request request);

}
