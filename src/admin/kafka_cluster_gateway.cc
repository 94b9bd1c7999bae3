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

#include <rfalter/admin/kafka_cluster_gateway.hh>
#include <rfalter/utils/logger.hh>

#include <seastar/core/do_with.hh>

#include <algorithm>

using namespace seastar;

namespace rfalter {

std::vector<broker> brokers_from_metadata(const metadata_response& metadata) {
    std::vector<broker> brokers;
    if (metadata._brokers.is_null()) {
        return brokers;
    }
    brokers.reserve(metadata._brokers->size());
    for (const auto& b : *metadata._brokers) {
        brokers.push_back(broker{*b._node_id, b._rack.is_null() ? std::string() : std::string(*b._rack)});
    }
    std::sort(brokers.begin(), brokers.end(), [] (auto& a, auto& b) {
        return a.id < b.id;
    });
    return brokers;
}

std::vector<partition_info> partitions_from_metadata(const metadata_response& metadata, const std::string& topic) {
    if (!metadata._topics.is_null()) {
        for (const auto& t : *metadata._topics) {
            if (std::string(*t._name) != topic) {
                continue;
            }
            std::vector<partition_info> partitions;
            if (t._partitions.is_null()) {
                return partitions;
            }
            for (const auto& p : *t._partitions) {
                if (p._error_code != error::kafka_error_code::NONE) {
                    rflog().warn("Partition {}-{} reported {}, using its replica list as is",
                            topic, *p._partition_index, p._error_code->_error_name);
                }
                partition_info info{*p._partition_index, {}};
                if (!p._replica_nodes.is_null()) {
                    for (const auto& replica : *p._replica_nodes) {
                        info.replicas.push_back(*replica);
                    }
                }
                partitions.push_back(std::move(info));
            }
            std::sort(partitions.begin(), partitions.end(), [] (auto& a, auto& b) {
                return a.partition < b.partition;
            });
            return partitions;
        }
    }
    throw cluster_exception("Topic " + topic + " is missing from the metadata response");
}

alter_partition_reassignments_request make_reassignment_request(const reassignment& proposed, int32_t timeout_ms) {
    alter_partition_reassignments_request request;
    request._timeout_ms = timeout_ms;

    // Map order keeps the partitions of one topic adjacent.
    std::vector<reassignable_topic> topics;
    for (const auto& [tp, replicas] : proposed) {
        if (topics.empty() || std::string(*topics.back()._name) != tp.topic) {
            reassignable_topic topic;
            topic._name = seastar::sstring(tp.topic);
            topic._partitions = std::vector<reassignable_partition>();
            topics.push_back(std::move(topic));
        }
        reassignable_partition partition;
        partition._partition_index = tp.partition;
        std::vector<kafka_int32_t> replica_nodes;
        replica_nodes.reserve(replicas.size());
        for (auto replica : replicas) {
            replica_nodes.emplace_back(replica);
        }
        partition._replicas = std::move(replica_nodes);
        topics.back()._partitions->push_back(std::move(partition));
    }
    request._topics = std::move(topics);
    return request;
}

void check_reassignment_response(const alter_partition_reassignments_response& response) {
    if (response._error_code != error::kafka_error_code::NONE) {
        std::string message(response._error_code->_error_name);
        if (!response._error_message.is_null() && !response._error_message->empty()) {
            message += ": " + std::string(*response._error_message);
        }
        throw cluster_exception("Reassignment rejected: " + message);
    }

    std::string failures;
    if (!response._responses.is_null()) {
        for (const auto& topic : *response._responses) {
            if (topic._partitions.is_null()) {
                continue;
            }
            for (const auto& partition : *topic._partitions) {
                if (partition._error_code == error::kafka_error_code::NONE) {
                    continue;
                }
                if (!failures.empty()) {
                    failures += ", ";
                }
                failures += std::string(*topic._name) + "-" + std::to_string(*partition._partition_index)
                        + " (" + std::string(partition._error_code->_error_name);
                if (!partition._error_message.is_null() && !partition._error_message->empty()) {
                    failures += ": " + std::string(*partition._error_message);
                }
                failures += ")";
            }
        }
    }
    if (!failures.empty()) {
        throw cluster_exception("Reassignment failed for " + failures);
    }
}

metadata_request brokers_metadata_request() {
    metadata_request request;
    request._topics = std::vector<metadata_request_topic>();
    request._allow_auto_topic_creation = 0;
    return request;
}

metadata_request topic_metadata_request(const std::string& topic) {
    metadata_request_topic requested_topic;
    requested_topic._name = seastar::sstring(topic);

    metadata_request request;
    request._topics = std::vector<metadata_request_topic>{requested_topic};
    request._allow_auto_topic_creation = 0;
    return request;
}

std::optional<connection_manager::connection_id> controller_of(const metadata_response& metadata) {
    if (metadata._brokers.is_null()) {
        return std::nullopt;
    }
    for (const auto& b : *metadata._brokers) {
        if (*b._node_id == *metadata._controller_id) {
            return connection_manager::connection_id(*b._host, static_cast<uint16_t>(*b._port));
        }
    }
    return std::nullopt;
}

attempt_outcome topic_error_outcome(const metadata_response_topic& topic) {
    const auto name = std::string(*topic._name);
    if (topic._error_code == error::kafka_error_code::NONE) {
        return attempt_outcome::done;
    }
    if (topic._error_code == error::kafka_error_code::UNKNOWN_TOPIC_OR_PARTITION) {
        throw cluster_exception("Topic " + name + " does not exist");
    }
    if (!topic._error_code->_is_retriable) {
        throw cluster_exception("Could not describe topic " + name + ": "
                + std::string(topic._error_code->_error_name));
    }
    return attempt_outcome::retry;
}

attempt_outcome reassignment_attempt_outcome(const alter_partition_reassignments_response& response) {
    if (response._error_code == error::kafka_error_code::NONE || !response._error_code->_is_retriable) {
        return attempt_outcome::done;
    }
    if (response._error_code->_invalidates_metadata) {
        return attempt_outcome::refresh_and_retry;
    }
    return attempt_outcome::retry;
}

kafka_cluster_gateway::kafka_cluster_gateway(admin_properties properties)
    : _properties(std::move(properties)),
    _connection_manager(_properties.client_id),
    _retry_helper(_properties.retries, _properties.retry_backoff_strategy()) {}

future<> kafka_cluster_gateway::init() {
    return _connection_manager.init(_properties.servers, _properties.request_timeout);
}

future<metadata_response> kafka_cluster_gateway::fetch_metadata(metadata_request request) {
    return do_with(std::move(request), std::optional<metadata_response>(), std::string("no attempt made"),
            [this] (metadata_request& request, std::optional<metadata_response>& result, std::string& last_error) {
        return _retry_helper.with_retry([this, &request, &result, &last_error] {
            // Reconnects to the bootstrap servers dropped by earlier failures.
            return _connection_manager.init(_properties.servers, _properties.request_timeout).then([this, &request] {
                return _connection_manager.ask_for_metadata(metadata_request(request));
            }).then([&result] (metadata_response metadata) {
                result = std::move(metadata);
                return do_retry::no;
            }).handle_exception_type([&last_error] (metadata_refresh_exception& e) {
                rflog().warn("Metadata request failed: {}", e.what());
                last_error = e.what();
                return do_retry::yes;
            });
        }).then([this, &result, &last_error] {
            if (!result) {
                throw cluster_exception("Could not fetch cluster metadata: " + last_error);
            }
            _metadata = *result;
            return std::move(*result);
        });
    });
}

future<std::vector<broker>> kafka_cluster_gateway::list_brokers() {
    return fetch_metadata(brokers_metadata_request()).then([] (metadata_response metadata) {
        auto brokers = brokers_from_metadata(metadata);
        rflog().debug("Cluster has {} live brokers", brokers.size());
        return brokers;
    });
}

future<std::vector<partition_info>> kafka_cluster_gateway::list_partitions(const std::string& topic) {
    return do_with(std::optional<std::vector<partition_info>>(), std::string("no attempt made"),
            [this, topic] (std::optional<std::vector<partition_info>>& result, std::string& last_error) {
        return _retry_helper.with_retry([this, topic, &result, &last_error] {
            return fetch_metadata(topic_metadata_request(topic)).then([topic, &result, &last_error] (metadata_response metadata) {
                if (!metadata._topics.is_null()) {
                    for (const auto& t : *metadata._topics) {
                        if (std::string(*t._name) != topic || topic_error_outcome(t) == attempt_outcome::done) {
                            continue;
                        }
                        rflog().warn("Describing topic {} failed with {}, retrying", topic, t._error_code->_error_name);
                        last_error = std::string(t._error_code->_error_name);
                        return do_retry::yes;
                    }
                }
                result = partitions_from_metadata(metadata, topic);
                return do_retry::no;
            });
        }).then([topic, &result, &last_error] {
            if (!result) {
                throw cluster_exception("Could not describe topic " + topic + ": " + last_error);
            }
            return std::move(*result);
        });
    });
}

future<std::optional<connection_manager::connection_id>> kafka_cluster_gateway::controller_address() {
    if (_metadata) {
        auto address = controller_of(*_metadata);
        if (address) {
            return make_ready_future<std::optional<connection_manager::connection_id>>(std::move(address));
        }
    }
    return fetch_metadata(brokers_metadata_request()).then([] (metadata_response metadata) {
        return controller_of(metadata);
    });
}

future<> kafka_cluster_gateway::submit_reassignment(const reassignment& proposed) {
    if (proposed.empty()) {
        rflog().info("Nothing to reassign");
        return make_ready_future<>();
    }

    auto request = make_reassignment_request(proposed, static_cast<int32_t>(_properties.request_timeout));
    return do_with(std::move(request), std::optional<alter_partition_reassignments_response>(), std::string("no attempt made"),
            [this] (alter_partition_reassignments_request& request,
                    std::optional<alter_partition_reassignments_response>& result, std::string& last_error) {
        return _retry_helper.with_retry([this, &request, &result, &last_error] {
            return controller_address().then([this, &request, &result, &last_error] (std::optional<connection_manager::connection_id> controller) {
                if (!controller) {
                    rflog().warn("Controller is not known yet, retrying");
                    last_error = "controller not available";
                    _metadata.reset();
                    return make_ready_future<do_retry>(do_retry::yes);
                }
                rflog().info("Submitting reassignment to controller {}:{}", controller->first, controller->second);
                return _connection_manager.send(request, controller->first, controller->second, _properties.request_timeout)
                .then([this, &result, &last_error] (alter_partition_reassignments_response response) {
                    auto outcome = reassignment_attempt_outcome(response);
                    if (outcome == attempt_outcome::done) {
                        result = std::move(response);
                        return do_retry::no;
                    }
                    rflog().warn("Reassignment attempt failed with {}, retrying", response._error_code->_error_name);
                    last_error = std::string(response._error_code->_error_name);
                    if (outcome == attempt_outcome::refresh_and_retry) {
                        _metadata.reset();
                    }
                    return do_retry::yes;
                });
            });
        }).then([&result, &last_error] {
            if (!result) {
                throw cluster_exception("Reassignment was not accepted: " + last_error);
            }
            check_reassignment_response(*result);
        });
    });
}

future<> kafka_cluster_gateway::disconnect() {
    return _connection_manager.disconnect_all();
}

}
