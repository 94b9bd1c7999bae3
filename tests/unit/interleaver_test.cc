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

#define BOOST_TEST_MODULE interleaver
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <map>
#include <random>

#include <rfalter/placement/interleaver.hh>
#include <rfalter/placement/rack_grouper.hh>

namespace rf = rfalter;

BOOST_AUTO_TEST_CASE(interleave_takes_one_from_each_in_turn) {
    std::vector<std::vector<int>> groups {{1, 2, 3}, {10}, {20, 21}};

    auto result = rf::interleave(groups);

    std::vector<int> expected{1, 10, 20, 2, 21, 3};
    BOOST_TEST(result == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(interleave_single_group_passes_through) {
    std::vector<std::vector<int>> groups {{4, 2, 9}};

    auto result = rf::interleave(groups);

    std::vector<int> expected{4, 2, 9};
    BOOST_TEST(result == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(interleave_empty_inputs) {
    BOOST_CHECK(rf::interleave(std::vector<std::vector<int>>{}).empty());
    BOOST_CHECK(rf::interleave(std::vector<std::vector<int>>{{}, {}}).empty());
}

BOOST_AUTO_TEST_CASE(rack_alternating_order_of_two_racks) {
    std::vector<rf::broker> brokers {{1, "rackA"}, {2, "rackA"}, {3, "rackB"}, {4, "rackB"}};

    auto ordering = rf::rack_alternating_order(brokers);

    rf::broker_ordering expected{1, 3, 2, 4};
    BOOST_TEST(ordering == expected, boost::test_tools::per_element());
}

// Random clusters: the ordering is a permutation, and two neighbours share a
// rack only once every other rack has run out of brokers.
BOOST_AUTO_TEST_CASE(rack_alternating_order_properties) {
    std::mt19937 mt(42);
    for (int round = 0; round < 200; round++) {
        std::uniform_int_distribution<int> rack_count_dist(1, 5);
        std::uniform_int_distribution<int> broker_count_dist(0, 20);
        auto rack_count = rack_count_dist(mt);
        auto broker_count = broker_count_dist(mt);
        std::uniform_int_distribution<int> rack_dist(0, rack_count - 1);

        std::vector<rf::broker> brokers;
        std::map<rf::broker_id, std::string> rack_of;
        for (int i = 0; i < broker_count; i++) {
            auto rack = "rack" + std::to_string(rack_dist(mt));
            brokers.push_back(rf::broker{100 + i, rack});
            rack_of[100 + i] = rack;
        }

        auto ordering = rf::rack_alternating_order(brokers);

        BOOST_REQUIRE_EQUAL(ordering.size(), brokers.size());
        auto sorted = ordering;
        std::sort(sorted.begin(), sorted.end());
        BOOST_CHECK(std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end());
        for (const auto& b : brokers) {
            BOOST_CHECK(std::binary_search(sorted.begin(), sorted.end(), b.id));
        }

        std::map<std::string, size_t> remaining;
        for (const auto& b : brokers) {
            remaining[b.rack]++;
        }
        for (size_t i = 0; i + 1 < ordering.size(); i++) {
            const auto& rack = rack_of[ordering[i]];
            remaining[rack]--;
            if (rack_of[ordering[i + 1]] == rack) {
                for (const auto& [other, left] : remaining) {
                    if (other != rack) {
                        BOOST_CHECK_EQUAL(left, 0);
                    }
                }
            }
        }
    }
}
