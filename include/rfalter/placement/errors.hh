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

namespace rfalter {

// Invalid request: bad replication factor, unknown strategy, bad config value.
struct configuration_error : public std::runtime_error {
public:
    explicit configuration_error(const std::string& message) : runtime_error(message) {}
};

// Partitions and brokers do not describe one consistent cluster snapshot.
struct topology_mismatch : public std::runtime_error {
public:
    explicit topology_mismatch(const std::string& message) : runtime_error(message) {}
};

}
