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

#include <rfalter/admin/alter_replication_factor.hh>
#include <rfalter/placement/errors.hh>

using namespace seastar;
namespace rf = rfalter;

namespace {

class fake_cluster_gateway final : public rf::cluster_gateway {
public:
    std::vector<rf::broker> brokers;
    std::vector<rf::partition_info> partitions;
    std::vector<rf::reassignment> submitted;
    int list_partitions_calls = 0;
    bool fail_submit = false;

    future<std::vector<rf::broker>> list_brokers() override {
        return make_ready_future<std::vector<rf::broker>>(brokers);
    }

    future<std::vector<rf::partition_info>> list_partitions(const std::string& topic) override {
        list_partitions_calls++;
        if (topic != "events") {
            return make_exception_future<std::vector<rf::partition_info>>(
                    rf::cluster_exception("Topic " + topic + " does not exist"));
        }
        return make_ready_future<std::vector<rf::partition_info>>(partitions);
    }

    future<> submit_reassignment(const rf::reassignment& proposed) override {
        if (fail_submit) {
            return make_exception_future<>(rf::cluster_exception("Reassignment rejected: NOT_CONTROLLER"));
        }
        submitted.push_back(proposed);
        return make_ready_future<>();
    }
};

fake_cluster_gateway two_rack_cluster() {
    fake_cluster_gateway gateway;
    gateway.brokers = {{1, "rackA"}, {2, "rackA"}, {3, "rackB"}, {4, "rackB"}};
    gateway.partitions = {{0, {1}}, {1, {2}}, {2, {3}}};
    return gateway;
}

rf::alter_request request_for(int32_t replication_factor, rf::dry_run dry = rf::dry_run::no) {
    rf::alter_request request;
    request.topic = "events";
    request.replication_factor = replication_factor;
    request.dry_run_enabled = dry;
    return request;
}

}

SEASTAR_THREAD_TEST_CASE(alter_replication_factor_submits_placement) {
    auto gateway = two_rack_cluster();

    auto result = rf::alter_replication_factor(gateway, request_for(2)).get();

    BOOST_CHECK(result.submitted);
    BOOST_REQUIRE_EQUAL(gateway.submitted.size(), 1);
    BOOST_CHECK(gateway.submitted[0] == result.proposed);
    BOOST_CHECK_EQUAL(result.current.size(), 3);

    std::vector<rf::broker_id> p0{1, 3};
    std::vector<rf::broker_id> p1{3, 2};
    std::vector<rf::broker_id> p2{2, 4};
    BOOST_TEST(result.proposed.at({"events", 0}) == p0, boost::test_tools::per_element());
    BOOST_TEST(result.proposed.at({"events", 1}) == p1, boost::test_tools::per_element());
    BOOST_TEST(result.proposed.at({"events", 2}) == p2, boost::test_tools::per_element());
}

SEASTAR_THREAD_TEST_CASE(alter_replication_factor_dry_run_submits_nothing) {
    auto gateway = two_rack_cluster();

    auto result = rf::alter_replication_factor(gateway, request_for(3, rf::dry_run::yes)).get();

    BOOST_CHECK(!result.submitted);
    BOOST_CHECK(gateway.submitted.empty());
    BOOST_CHECK_EQUAL(result.proposed.size(), 3);
    for (const auto& [tp, replicas] : result.proposed) {
        BOOST_CHECK_EQUAL(replicas.size(), 3);
    }
}

SEASTAR_THREAD_TEST_CASE(alter_replication_factor_topic_without_partitions) {
    auto gateway = two_rack_cluster();
    gateway.partitions.clear();

    auto result = rf::alter_replication_factor(gateway, request_for(2)).get();

    BOOST_CHECK(result.proposed.empty());
    BOOST_CHECK(!result.submitted);
    BOOST_CHECK(gateway.submitted.empty());
}

SEASTAR_THREAD_TEST_CASE(alter_replication_factor_rejects_before_reading_partitions) {
    auto gateway = two_rack_cluster();

    BOOST_CHECK_THROW(rf::alter_replication_factor(gateway, request_for(5)).get(), rf::configuration_error);
    BOOST_CHECK_THROW(rf::alter_replication_factor(gateway, request_for(0)).get(), rf::configuration_error);
    BOOST_CHECK_EQUAL(gateway.list_partitions_calls, 0);
    BOOST_CHECK(gateway.submitted.empty());
}

SEASTAR_THREAD_TEST_CASE(alter_replication_factor_topology_mismatch) {
    auto gateway = two_rack_cluster();
    gateway.partitions.push_back(rf::partition_info{3, {9}});

    BOOST_CHECK_THROW(rf::alter_replication_factor(gateway, request_for(2)).get(), rf::topology_mismatch);
    BOOST_CHECK(gateway.submitted.empty());
}

SEASTAR_THREAD_TEST_CASE(alter_replication_factor_unknown_strategy) {
    auto gateway = two_rack_cluster();
    auto request = request_for(2);
    request.strategy = "random";

    BOOST_CHECK_THROW(rf::alter_replication_factor(gateway, std::move(request)).get(), rf::configuration_error);
    BOOST_CHECK(gateway.submitted.empty());
}

SEASTAR_THREAD_TEST_CASE(alter_replication_factor_cluster_failures) {
    auto gateway = two_rack_cluster();
    auto request = request_for(2);
    request.topic = "missing";
    BOOST_CHECK_THROW(rf::alter_replication_factor(gateway, std::move(request)).get(), rf::cluster_exception);

    gateway.fail_submit = true;
    BOOST_CHECK_THROW(rf::alter_replication_factor(gateway, request_for(2)).get(), rf::cluster_exception);
}
