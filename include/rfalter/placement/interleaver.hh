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

#include <algorithm>
#include <vector>

#include <rfalter/placement/topology.hh>

namespace rfalter {

// Takes a number of sequences and interleaves them by choosing one element
// from each in turn: round i appends the i-th element of every sequence
// that still has one, in sequence order.
template<typename T>
std::vector<T> interleave(const std::vector<std::vector<T>>& sequences) {
    size_t total = 0;
    size_t rounds = 0;
    for (const auto& sequence : sequences) {
        total += sequence.size();
        rounds = std::max(rounds, sequence.size());
    }

    std::vector<T> result;
    result.reserve(total);
    for (size_t i = 0; i < rounds; i++) {
        for (const auto& sequence : sequences) {
            if (i < sequence.size()) {
                result.push_back(sequence[i]);
            }
        }
    }
    return result;
}

// Broker ids ordered so that neighbours sit in different racks for as long
// as more than one rack has brokers left.
broker_ordering rack_alternating_order(const std::vector<broker>& brokers);

}
