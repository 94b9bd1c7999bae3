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

#include <stdexcept>
#include <string>
#include <vector>

#include <seastar/core/future.hh>

#include <rfalter/placement/topology.hh>

using namespace seastar;

namespace rfalter {

struct cluster_exception : public std::runtime_error {
public:
    explicit cluster_exception(const std::string& message) : runtime_error(message) {}
};

// Source of the current topology and sink of the computed reassignment.
class cluster_gateway {
public:
    // Live brokers with their rack labels.
    virtual future<std::vector<broker>> list_brokers() = 0;
    // Current partitions of `topic`, ordered by partition number.
    virtual future<std::vector<partition_info>> list_partitions(const std::string& topic) = 0;
    virtual future<> submit_reassignment(const reassignment& proposed) = 0;
    virtual ~cluster_gateway() = default;
};

}
