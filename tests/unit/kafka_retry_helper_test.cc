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

#include <seastar/testing/thread_test_case.hh>
#include <seastar/testing/test_runner.hh>
#include <vector>

#include <rfalter/utils/retry_helper.hh>
#include <rfalter/utils/defaults.hh>

using namespace seastar;
namespace rf = rfalter;

SEASTAR_THREAD_TEST_CASE(retry_helper_test_early_stop) {
    rf::retry_helper helper(5, rf::defaults::exp_retry_backoff(1, 1000));
    auto retry_count = 0;
    helper.with_retry([&retry_count] {
        retry_count++;
        return retry_count >= 3 ? rf::do_retry::no : rf::do_retry::yes;
    }).get();
    BOOST_REQUIRE_EQUAL(retry_count, 3);
}

SEASTAR_THREAD_TEST_CASE(retry_helper_test_capped_retries) {
    rf::retry_helper helper(4, rf::defaults::exp_retry_backoff(1, 2));
    auto retry_count = 0;
    helper.with_retry([&retry_count] {
        retry_count++;
        return make_ready_future<rf::do_retry>(rf::do_retry::yes);
    }).get();
    BOOST_REQUIRE_EQUAL(retry_count, 4);
}

SEASTAR_THREAD_TEST_CASE(retry_helper_test_exception_stops_retrying) {
    rf::retry_helper helper(5, rf::defaults::exp_retry_backoff(1, 1000));
    auto retry_count = 0;
    auto f = helper.with_retry([&retry_count] () -> rf::do_retry {
        retry_count++;
        throw std::runtime_error("broken");
    });
    BOOST_CHECK_THROW(f.get(), std::runtime_error);
    BOOST_REQUIRE_EQUAL(retry_count, 1);
}
