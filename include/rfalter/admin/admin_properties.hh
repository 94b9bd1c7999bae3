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

#include <set>
#include <string>
#include <utility>

#include <seastar/core/sstring.hh>
#include <seastar/util/noncopyable_function.hh>

#include <rfalter/admin/properties_file.hh>
#include <rfalter/utils/defaults.hh>

namespace rfalter {

class admin_properties final {

public:

    // number of ms after which a connection attempt or a request is considered to have timed out,
    // also passed to the controller as the reassignment timeout
    uint32_t request_timeout = 30000;
    // maximum number of attempts of a single admin operation
    uint32_t retries = 5;
    // base and cap, in ms, of the exponential backoff between attempts
    uint32_t retry_backoff = 100;
    uint32_t retry_backoff_max = 1000;

    seastar::sstring client_id {defaults::CLIENT_ID};
    // a list of host-port pairs to use for establishing the initial connection to the cluster
    std::set<std::pair<seastar::sstring, uint16_t>> servers {};

    seastar::noncopyable_function<seastar::future<>(uint32_t)> retry_backoff_strategy() const {
        return defaults::exp_retry_backoff(retry_backoff, retry_backoff_max);
    }
};

// Parses "host:port,host:port". IPv6 hosts go in brackets: "[::1]:9092".
std::set<std::pair<seastar::sstring, uint16_t>> parse_servers(const std::string& servers);

// Throws configuration_error on malformed or unsupported values.
// Unknown keys are logged and ignored.
admin_properties make_admin_properties(const properties_map& properties);

// Command line bootstrap servers overlaid with the optional config file,
// whose values win.
admin_properties load_admin_properties(const std::string& bootstrap_servers, const std::string& command_config);

}
