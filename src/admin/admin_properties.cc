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

#include <rfalter/admin/admin_properties.hh>
#include <rfalter/placement/errors.hh>
#include <rfalter/utils/logger.hh>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include <limits>
#include <string>
#include <vector>

namespace rfalter {

namespace {

template<typename NumberType>
NumberType parse_number(const std::string& key, const std::string& value) {
    if (!value.empty() && value[0] == '-') {
        throw configuration_error("Invalid value '" + value + "' for " + key);
    }
    try {
        return boost::lexical_cast<NumberType>(value);
    } catch (boost::bad_lexical_cast& e) {
        throw configuration_error("Invalid value '" + value + "' for " + key);
    }
}

}

std::set<std::pair<seastar::sstring, uint16_t>> parse_servers(const std::string& servers) {
    std::vector<std::string> entries;
    boost::algorithm::split(entries, servers, boost::algorithm::is_any_of(","));

    std::set<std::pair<seastar::sstring, uint16_t>> result;
    for (auto& entry : entries) {
        boost::algorithm::trim(entry);
        if (entry.empty()) {
            continue;
        }
        auto colon = entry.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == entry.size()) {
            throw configuration_error("Invalid bootstrap server '" + entry + "', expected host:port");
        }
        auto host = entry.substr(0, colon);
        if (host.front() == '[') {
            if (host.back() != ']') {
                throw configuration_error("Invalid bootstrap server '" + entry + "', unbalanced brackets");
            }
            host = host.substr(1, host.size() - 2);
        }
        auto port = parse_number<uint16_t>("bootstrap.servers", entry.substr(colon + 1));
        if (port == 0) {
            throw configuration_error("Invalid bootstrap server '" + entry + "', port must be positive");
        }
        result.emplace(seastar::sstring(host), port);
    }
    if (result.empty()) {
        throw configuration_error("No bootstrap servers given");
    }
    return result;
}

admin_properties make_admin_properties(const properties_map& properties) {
    admin_properties result;
    result.servers = parse_servers(defaults::BOOTSTRAP_SERVERS);

    for (const auto& [key, value] : properties) {
        if (key == "bootstrap.servers") {
            result.servers = parse_servers(value);
        } else if (key == "client.id") {
            result.client_id = value;
        } else if (key == "request.timeout.ms") {
            result.request_timeout = parse_number<uint32_t>(key, value);
        } else if (key == "retries") {
            result.retries = parse_number<uint32_t>(key, value);
        } else if (key == "retry.backoff.ms") {
            result.retry_backoff = parse_number<uint32_t>(key, value);
        } else if (key == "retry.backoff.max.ms") {
            result.retry_backoff_max = parse_number<uint32_t>(key, value);
        } else if (key == "security.protocol") {
            if (value != "PLAINTEXT") {
                throw configuration_error("Unsupported security.protocol '" + value + "', only PLAINTEXT is available");
            }
        } else {
            rflog().warn("Ignoring unsupported property {}", key);
        }
    }

    if (result.retries == 0) {
        throw configuration_error("retries must be at least 1");
    }
    if (result.request_timeout == 0) {
        throw configuration_error("request.timeout.ms must be positive");
    }
    // sent to the controller as an int32
    if (result.request_timeout > static_cast<uint32_t>(std::numeric_limits<int32_t>::max())) {
        throw configuration_error("request.timeout.ms must not exceed "
                + std::to_string(std::numeric_limits<int32_t>::max()));
    }
    return result;
}

admin_properties load_admin_properties(const std::string& bootstrap_servers, const std::string& command_config) {
    properties_map properties {{"bootstrap.servers", bootstrap_servers}};
    if (!command_config.empty()) {
        for (auto& [key, value] : load_properties_file(command_config)) {
            properties[key] = value;
        }
    }
    return make_admin_properties(properties);
}

}
