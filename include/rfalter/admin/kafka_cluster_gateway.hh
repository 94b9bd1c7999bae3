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

#include <optional>

#include <rfalter/admin/admin_properties.hh>
#include <rfalter/admin/cluster_gateway.hh>
#include <rfalter/connection/connection_manager.hh>
#include <rfalter/protocol/alter_partition_reassignments_request.hh>
#include <rfalter/utils/retry_helper.hh>

using namespace seastar;

namespace rfalter {

// cluster_gateway speaking the Kafka protocol: Metadata to read the
// topology, AlterPartitionReassignments on the controller to submit.
class kafka_cluster_gateway final : public cluster_gateway {

private:
    admin_properties _properties;
    connection_manager _connection_manager;
    retry_helper _retry_helper;
    // Latest metadata, used to locate the controller.
    std::optional<metadata_response> _metadata;

    future<metadata_response> fetch_metadata(metadata_request request);
    future<std::optional<connection_manager::connection_id>> controller_address();

public:
    explicit kafka_cluster_gateway(admin_properties properties);

    future<> init();

    future<std::vector<broker>> list_brokers() override;
    future<std::vector<partition_info>> list_partitions(const std::string& topic) override;
    future<> submit_reassignment(const reassignment& proposed) override;

    future<> disconnect();
};

// Brokers sorted by id; a null rack becomes the empty label.
std::vector<broker> brokers_from_metadata(const metadata_response& metadata);

// Partitions of `topic` sorted by index. Throws cluster_exception when the
// topic is missing from the response.
std::vector<partition_info> partitions_from_metadata(const metadata_response& metadata, const std::string& topic);

// What to do after one attempt of a retried admin operation.
enum class attempt_outcome {
    done,
    retry,
    // the cached metadata is stale, e.g. the controller moved
    refresh_and_retry,
};

// Empty topic list: brokers and controller only. Null would ask for every topic.
metadata_request brokers_metadata_request();
metadata_request topic_metadata_request(const std::string& topic);

// Address of the controller, or nullopt when no listed broker has its id.
std::optional<connection_manager::connection_id> controller_of(const metadata_response& metadata);

// Throws cluster_exception when the topic does not exist or the error is
// not retriable.
attempt_outcome topic_error_outcome(const metadata_response_topic& topic);

// Non-retriable errors are `done`; check_reassignment_response reports them.
attempt_outcome reassignment_attempt_outcome(const alter_partition_reassignments_response& response);

alter_partition_reassignments_request make_reassignment_request(const reassignment& proposed, int32_t timeout_ms);

// Throws cluster_exception naming every rejected partition.
void check_reassignment_response(const alter_partition_reassignments_response& response);

}
