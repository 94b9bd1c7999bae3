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

#include <sstream>

#include <rfalter/admin/admin_properties.hh>
#include <rfalter/admin/properties_file.hh>
#include <rfalter/placement/errors.hh>

using namespace seastar;
namespace rf = rfalter;

SEASTAR_THREAD_TEST_CASE(properties_file_separators_and_comments) {
    std::istringstream input(
            "# comment\n"
            "! another comment\n"
            "\n"
            "bootstrap.servers=a:9092,b:9093\r\n"
            "client.id : admin\n"
            "retries 7\n"
            "request.timeout.ms = 1500  \n"
            "   retry.backoff.ms=20\n");

    auto properties = rf::parse_properties(input);

    BOOST_REQUIRE_EQUAL(properties.size(), 5);
    BOOST_CHECK_EQUAL(properties["bootstrap.servers"], "a:9092,b:9093");
    BOOST_CHECK_EQUAL(properties["client.id"], "admin");
    BOOST_CHECK_EQUAL(properties["retries"], "7");
    BOOST_CHECK_EQUAL(properties["request.timeout.ms"], "1500");
    BOOST_CHECK_EQUAL(properties["retry.backoff.ms"], "20");
}

SEASTAR_THREAD_TEST_CASE(properties_file_continuation_lines) {
    std::istringstream input(
            "bootstrap.servers=a:9092,\\\n"
            "    b:9092\n"
            "empty.key\n");

    auto properties = rf::parse_properties(input);

    BOOST_CHECK_EQUAL(properties["bootstrap.servers"], "a:9092,b:9092");
    BOOST_CHECK_EQUAL(properties["empty.key"], "");
}

SEASTAR_THREAD_TEST_CASE(properties_file_escapes) {
    std::istringstream input(
            "client.id=C:\\\\tools\n"
            "sasl\\=key=v\n"
            "key\\ with\\ spaces = tab\\there\n"
            "unicode=caf\\u00e9\n");

    auto properties = rf::parse_properties(input);

    BOOST_REQUIRE_EQUAL(properties.size(), 4);
    BOOST_CHECK_EQUAL(properties["client.id"], "C:\\tools");
    BOOST_CHECK_EQUAL(properties["sasl=key"], "v");
    BOOST_CHECK_EQUAL(properties["key with spaces"], "tab\there");
    BOOST_CHECK_EQUAL(properties["unicode"], "caf\xc3\xa9");

    std::istringstream truncated("broken=\\u12\n");
    BOOST_CHECK_THROW(rf::parse_properties(truncated), rf::configuration_error);
}

SEASTAR_THREAD_TEST_CASE(properties_file_missing) {
    BOOST_CHECK_THROW(rf::load_properties_file("/nonexistent/admin.properties"), rf::configuration_error);
    BOOST_CHECK_THROW(rf::load_admin_properties("localhost:9092", "/nonexistent/admin.properties"),
            rf::configuration_error);
}

SEASTAR_THREAD_TEST_CASE(parse_servers_test) {
    auto servers = rf::parse_servers(" broker1:9092, [::1]:9093 ,,10.0.0.1:19092");

    BOOST_REQUIRE_EQUAL(servers.size(), 3);
    BOOST_CHECK(servers.count({"broker1", 9092}));
    BOOST_CHECK(servers.count({"::1", 9093}));
    BOOST_CHECK(servers.count({"10.0.0.1", 19092}));

    BOOST_CHECK_THROW(rf::parse_servers(""), rf::configuration_error);
    BOOST_CHECK_THROW(rf::parse_servers("broker1"), rf::configuration_error);
    BOOST_CHECK_THROW(rf::parse_servers("broker1:"), rf::configuration_error);
    BOOST_CHECK_THROW(rf::parse_servers("broker1:0"), rf::configuration_error);
    BOOST_CHECK_THROW(rf::parse_servers("broker1:70000"), rf::configuration_error);
    BOOST_CHECK_THROW(rf::parse_servers("broker1:-1"), rf::configuration_error);
    BOOST_CHECK_THROW(rf::parse_servers("[::1:9092"), rf::configuration_error);
}

SEASTAR_THREAD_TEST_CASE(admin_properties_defaults) {
    auto properties = rf::make_admin_properties({});

    BOOST_CHECK_EQUAL(properties.request_timeout, 30000);
    BOOST_CHECK_EQUAL(properties.retries, 5);
    BOOST_CHECK_EQUAL(properties.retry_backoff, 100);
    BOOST_CHECK_EQUAL(properties.retry_backoff_max, 1000);
    BOOST_CHECK_EQUAL(std::string(properties.client_id), "kafka-alter-rf");
    BOOST_REQUIRE_EQUAL(properties.servers.size(), 1);
    BOOST_CHECK(properties.servers.count({"localhost", 9092}));
}

SEASTAR_THREAD_TEST_CASE(admin_properties_overrides) {
    auto properties = rf::make_admin_properties({
        {"bootstrap.servers", "k1:9092,k2:9092"},
        {"client.id", "ops"},
        {"request.timeout.ms", "5000"},
        {"retries", "2"},
        {"retry.backoff.ms", "10"},
        {"retry.backoff.max.ms", "50"},
        {"security.protocol", "PLAINTEXT"},
        {"sasl.mechanism", "PLAIN"},
    });

    BOOST_CHECK_EQUAL(properties.servers.size(), 2);
    BOOST_CHECK_EQUAL(std::string(properties.client_id), "ops");
    BOOST_CHECK_EQUAL(properties.request_timeout, 5000);
    BOOST_CHECK_EQUAL(properties.retries, 2);
    BOOST_CHECK_EQUAL(properties.retry_backoff, 10);
    BOOST_CHECK_EQUAL(properties.retry_backoff_max, 50);
}

SEASTAR_THREAD_TEST_CASE(admin_properties_invalid_values) {
    BOOST_CHECK_THROW(rf::make_admin_properties({{"retries", "-3"}}), rf::configuration_error);
    BOOST_CHECK_THROW(rf::make_admin_properties({{"retries", "0"}}), rf::configuration_error);
    BOOST_CHECK_THROW(rf::make_admin_properties({{"request.timeout.ms", "soon"}}), rf::configuration_error);
    BOOST_CHECK_THROW(rf::make_admin_properties({{"request.timeout.ms", "0"}}), rf::configuration_error);
    BOOST_CHECK_THROW(rf::make_admin_properties({{"request.timeout.ms", "2147483648"}}), rf::configuration_error);
    BOOST_CHECK_EQUAL(rf::make_admin_properties({{"request.timeout.ms", "2147483647"}}).request_timeout, 2147483647u);
    BOOST_CHECK_THROW(rf::make_admin_properties({{"security.protocol", "SSL"}}), rf::configuration_error);
}
