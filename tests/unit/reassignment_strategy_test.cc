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

#define BOOST_TEST_MODULE reassignment_strategy
#include <boost/test/unit_test.hpp>

#include <rfalter/placement/errors.hh>
#include <rfalter/placement/reassignment_strategy.hh>
#include <rfalter/placement/validation.hh>

namespace rf = rfalter;

namespace {

const std::vector<rf::broker> two_racks {{1, "rackA"}, {2, "rackA"}, {3, "rackB"}, {4, "rackB"}};

std::vector<rf::partition_info> partitions(int count) {
    std::vector<rf::partition_info> result;
    for (int i = 0; i < count; i++) {
        result.push_back(rf::partition_info{i, {1}});
    }
    return result;
}

std::unique_ptr<rf::reassignment_strategy> make(const std::vector<rf::broker>& brokers,
        std::vector<rf::partition_info> current, int32_t replication_factor) {
    return rf::make_reassignment_strategy(rf::strategies::ROUND_ROBIN_ACROSS_RACKS, "events",
            brokers, std::move(current), replication_factor);
}

}

BOOST_AUTO_TEST_CASE(round_robin_across_racks_two_racks) {
    auto result = make(two_racks, partitions(3), 2)->reassignments();

    BOOST_REQUIRE_EQUAL(result.size(), 3);
    std::vector<rf::broker_id> p0{1, 3};
    std::vector<rf::broker_id> p1{3, 2};
    std::vector<rf::broker_id> p2{2, 4};
    BOOST_TEST(result.at({"events", 0}) == p0, boost::test_tools::per_element());
    BOOST_TEST(result.at({"events", 1}) == p1, boost::test_tools::per_element());
    BOOST_TEST(result.at({"events", 2}) == p2, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(round_robin_across_racks_single_rack) {
    std::vector<rf::broker> brokers {{1, "rackX"}, {2, "rackX"}, {3, "rackX"}};

    auto result = make(brokers, partitions(1), 2)->reassignments();

    std::vector<rf::broker_id> p0{1, 2};
    BOOST_TEST(result.at({"events", 0}) == p0, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(round_robin_across_racks_uses_partition_number_as_phase) {
    std::vector<rf::partition_info> current {{5, {1, 2}}, {2, {3}}};

    auto result = make(two_racks, std::move(current), 3)->reassignments();

    BOOST_REQUIRE_EQUAL(result.size(), 2);
    std::vector<rf::broker_id> p5{3, 2, 4};
    std::vector<rf::broker_id> p2{2, 4, 1};
    BOOST_TEST(result.at({"events", 5}) == p5, boost::test_tools::per_element());
    BOOST_TEST(result.at({"events", 2}) == p2, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(round_robin_across_racks_no_partitions) {
    BOOST_CHECK(make(two_racks, {}, 2)->reassignments().empty());
}

BOOST_AUTO_TEST_CASE(round_robin_across_racks_spreads_leaders) {
    auto result = make(two_racks, partitions(8), 1)->reassignments();

    std::map<rf::broker_id, int> leaders;
    for (const auto& [tp, replicas] : result) {
        leaders[replicas.front()]++;
    }
    BOOST_CHECK_EQUAL(leaders.size(), 4);
    for (const auto& [id, count] : leaders) {
        BOOST_CHECK_EQUAL(count, 2);
    }
}

BOOST_AUTO_TEST_CASE(replication_factor_bounds) {
    BOOST_CHECK_NO_THROW(make(two_racks, partitions(2), 4));
    BOOST_CHECK_THROW(make(two_racks, partitions(2), 5), rf::configuration_error);
    BOOST_CHECK_THROW(make(two_racks, partitions(2), 0), rf::configuration_error);
    BOOST_CHECK_THROW(make(two_racks, partitions(2), -1), rf::configuration_error);
    BOOST_CHECK_THROW(make({}, {}, 1), rf::configuration_error);
}

// The replication factor is rejected before the partitions are looked at,
// even when they are inconsistent.
BOOST_AUTO_TEST_CASE(replication_factor_checked_before_partitions) {
    std::vector<rf::partition_info> broken {{0, {99}}};

    BOOST_CHECK_THROW(make(two_racks, broken, 5), rf::configuration_error);
    BOOST_CHECK_THROW(make(two_racks, broken, 2), rf::topology_mismatch);
}

BOOST_AUTO_TEST_CASE(replication_factor_message) {
    try {
        rf::validate_replication_factor(two_racks, 5);
        BOOST_FAIL("expected configuration_error");
    } catch (rf::configuration_error& e) {
        BOOST_CHECK(std::string(e.what()).find("replication factor cannot exceed broker count") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(topology_mismatches) {
    std::vector<rf::broker> duplicated {{1, "rackA"}, {1, "rackB"}};
    BOOST_CHECK_THROW(rf::validate_topology(duplicated, {}), rf::topology_mismatch);

    BOOST_CHECK_THROW(rf::validate_topology(two_racks, {{-1, {1}}}), rf::topology_mismatch);
    BOOST_CHECK_THROW(rf::validate_topology(two_racks, {{0, {1}}, {0, {2}}}), rf::topology_mismatch);
    BOOST_CHECK_THROW(rf::validate_topology(two_racks, {{0, {1, 5}}}), rf::topology_mismatch);
    BOOST_CHECK_THROW(rf::validate_topology(two_racks, {{0, {2, 2}}}), rf::topology_mismatch);
    BOOST_CHECK_NO_THROW(rf::validate_topology(two_racks, {{0, {}}, {1, {4, 3, 2, 1}}}));
}

BOOST_AUTO_TEST_CASE(unknown_strategy) {
    try {
        rf::make_reassignment_strategy("minimal-movement", "events", two_racks, partitions(1), 1);
        BOOST_FAIL("expected configuration_error");
    } catch (rf::configuration_error& e) {
        BOOST_CHECK_EQUAL(std::string(e.what()),
                "unknown reassignment strategy 'minimal-movement', available: round-robin-across-racks");
    }
    BOOST_CHECK_EQUAL(rf::strategies::names().size(), 1);
}
