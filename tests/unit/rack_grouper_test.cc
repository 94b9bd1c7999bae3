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

#define BOOST_TEST_MODULE rack_grouper
#include <boost/test/unit_test.hpp>

#include <rfalter/placement/rack_grouper.hh>

namespace rf = rfalter;

BOOST_AUTO_TEST_CASE(rack_grouper_groups_in_first_seen_order) {
    std::vector<rf::broker> brokers {{5, "rackB"}, {1, "rackA"}, {7, "rackB"}, {2, "rackC"}, {3, "rackA"}};

    auto groups = rf::group_by_rack(brokers);

    BOOST_REQUIRE_EQUAL(groups.size(), 3);
    BOOST_CHECK_EQUAL(groups[0].rack, "rackB");
    BOOST_CHECK_EQUAL(groups[1].rack, "rackA");
    BOOST_CHECK_EQUAL(groups[2].rack, "rackC");

    std::vector<rf::broker_id> rack_b{5, 7};
    std::vector<rf::broker_id> rack_a{1, 3};
    std::vector<rf::broker_id> rack_c{2};
    BOOST_TEST(groups[0].brokers == rack_b, boost::test_tools::per_element());
    BOOST_TEST(groups[1].brokers == rack_a, boost::test_tools::per_element());
    BOOST_TEST(groups[2].brokers == rack_c, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(rack_grouper_brokers_without_rack_share_a_group) {
    std::vector<rf::broker> brokers {{1, ""}, {2, "rackA"}, {3, ""}};

    auto groups = rf::group_by_rack(brokers);

    BOOST_REQUIRE_EQUAL(groups.size(), 2);
    BOOST_CHECK_EQUAL(groups[0].rack, "");
    std::vector<rf::broker_id> unlabelled{1, 3};
    BOOST_TEST(groups[0].brokers == unlabelled, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(rack_grouper_labels_are_not_normalized) {
    std::vector<rf::broker> brokers {{1, "rackA"}, {2, "racka"}, {3, "rackA "}};

    auto groups = rf::group_by_rack(brokers);

    BOOST_CHECK_EQUAL(groups.size(), 3);
}

BOOST_AUTO_TEST_CASE(rack_grouper_empty_input) {
    BOOST_CHECK(rf::group_by_rack({}).empty());
}
