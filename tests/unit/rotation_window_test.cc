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

#define BOOST_TEST_MODULE rotation_window
#include <boost/test/unit_test.hpp>

#include <set>

#include <rfalter/placement/rotation_window.hh>

namespace rf = rfalter;

BOOST_AUTO_TEST_CASE(rotation_wraps_around) {
    std::vector<int> ordering{1, 3, 2, 4};

    std::vector<int> expected{4, 1, 3};
    auto window = rf::rotation(ordering, 3, 3);
    BOOST_TEST(window == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(rotation_windows_are_distinct_and_periodic) {
    std::vector<int> ordering{7, 1, 9, 4, 2, 8};
    auto n = ordering.size();

    for (size_t k = 1; k <= n; k++) {
        for (size_t p = 0; p < 3 * n; p++) {
            auto window = rf::rotation(ordering, p, k);
            BOOST_REQUIRE_EQUAL(window.size(), k);
            std::set<int> distinct(window.begin(), window.end());
            BOOST_CHECK_EQUAL(distinct.size(), k);
            BOOST_CHECK(window == rf::rotation(ordering, p + n, k));
            BOOST_CHECK_EQUAL(window[0], ordering[p % n]);
        }
    }
}

BOOST_AUTO_TEST_CASE(rotation_of_nothing) {
    std::vector<int> empty;
    BOOST_CHECK(rf::rotation(empty, 5, 0).empty());
    BOOST_CHECK_THROW(rf::rotation(empty, 0, 1), std::out_of_range);
}
