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

#include <rfalter/placement/topology.hh>

namespace rfalter {

struct rack_group {
    std::string rack;
    std::vector<broker_id> brokers;
};

// Groups brokers by rack label. Groups appear in the order their label is
// first seen, brokers keep their input order inside a group. Brokers
// without a rack share the group with an empty label.
std::vector<rack_group> group_by_rack(const std::vector<broker>& brokers);

}
