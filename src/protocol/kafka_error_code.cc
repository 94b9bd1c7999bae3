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

#include <unordered_map>
#include <rfalter/protocol/kafka_error_code.hh>

using namespace seastar;

namespace rfalter {

namespace error {

static std::unordered_map<int16_t, const kafka_error_code&> errors;

kafka_error_code::kafka_error_code (
    int16_t error_code,
    seastar::sstring error_name,
    seastar::sstring error_message,
    is_retriable is_retriable,
    invalidates_metadata invalidates_metadata)
    : _error_code(error_code),
    _error_name(std::move(error_name)),
    _error_message(std::move(error_message)),
    _is_retriable(is_retriable),
    _invalidates_metadata(invalidates_metadata) {
    errors.insert(std::pair<int16_t, const kafka_error_code&>(error_code, *this));
}

const kafka_error_code& kafka_error_code::get_error(int16_t value) noexcept {
    auto it = errors.find(value);
    return it != errors.end() ? it->second : UNKNOWN_SERVER_ERROR;
}

const kafka_error_code kafka_error_code::UNKNOWN_SERVER_ERROR (
    -1,
    "UNKNOWN_SERVER_ERROR",
    "The server experienced an unexpected error when processing the request.",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::NONE (
    0,
    "NONE",
    "",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::CORRUPT_MESSAGE (
    2,
    "CORRUPT_MESSAGE",
    "The message could not be parsed or is otherwise corrupt.",
    is_retriable::yes,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::UNKNOWN_TOPIC_OR_PARTITION (
    3,
    "UNKNOWN_TOPIC_OR_PARTITION",
    "This server does not host this topic-partition.",
    is_retriable::yes,
    invalidates_metadata::yes
);
const kafka_error_code kafka_error_code::LEADER_NOT_AVAILABLE (
    5,
    "LEADER_NOT_AVAILABLE",
    "There is no leader for this topic-partition as we are in the middle of a leadership election.",
    is_retriable::yes,
    invalidates_metadata::yes
);
const kafka_error_code kafka_error_code::NOT_LEADER_OR_FOLLOWER (
    6,
    "NOT_LEADER_OR_FOLLOWER",
    "For requests intended only for the leader, this error indicates that the broker is not the current leader.",
    is_retriable::yes,
    invalidates_metadata::yes
);
const kafka_error_code kafka_error_code::REQUEST_TIMED_OUT (
    7,
    "REQUEST_TIMED_OUT",
    "The request timed out.",
    is_retriable::yes,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::BROKER_NOT_AVAILABLE (
    8,
    "BROKER_NOT_AVAILABLE",
    "The broker is not available.",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::REPLICA_NOT_AVAILABLE (
    9,
    "REPLICA_NOT_AVAILABLE",
    "The replica is not available for the requested topic-partition.",
    is_retriable::yes,
    invalidates_metadata::yes
);
const kafka_error_code kafka_error_code::NETWORK_EXCEPTION (
    13,
    "NETWORK_EXCEPTION",
    "The server disconnected before a response was received.",
    is_retriable::yes,
    invalidates_metadata::yes
);
const kafka_error_code kafka_error_code::INVALID_TOPIC_EXCEPTION (
    17,
    "INVALID_TOPIC_EXCEPTION",
    "The request attempted to perform an operation on an invalid topic.",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::TOPIC_AUTHORIZATION_FAILED (
    29,
    "TOPIC_AUTHORIZATION_FAILED",
    "Topic authorization failed.",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::CLUSTER_AUTHORIZATION_FAILED (
    31,
    "CLUSTER_AUTHORIZATION_FAILED",
    "Cluster authorization failed.",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::UNSUPPORTED_VERSION (
    35,
    "UNSUPPORTED_VERSION",
    "The version of API is not supported.",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::INVALID_REPLICATION_FACTOR (
    38,
    "INVALID_REPLICATION_FACTOR",
    "Replication factor is below 1 or larger than the number of available brokers.",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::INVALID_REPLICA_ASSIGNMENT (
    39,
    "INVALID_REPLICA_ASSIGNMENT",
    "Replica assignment is invalid.",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::NOT_CONTROLLER (
    41,
    "NOT_CONTROLLER",
    "This is not the correct controller for this cluster.",
    is_retriable::yes,
    invalidates_metadata::yes
);
const kafka_error_code kafka_error_code::INVALID_REQUEST (
    42,
    "INVALID_REQUEST",
    "This most likely occurs because of a request being malformed by the "
    "client library or the message was sent to an incompatible broker.",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::POLICY_VIOLATION (
    44,
    "POLICY_VIOLATION",
    "Request parameters do not satisfy the configured policy.",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::KAFKA_STORAGE_ERROR (
    56,
    "KAFKA_STORAGE_ERROR",
    "Disk error when trying to access log file on the disk.",
    is_retriable::yes,
    invalidates_metadata::yes
);
const kafka_error_code kafka_error_code::REASSIGNMENT_IN_PROGRESS (
    60,
    "REASSIGNMENT_IN_PROGRESS",
    "A partition reassignment is in progress.",
    is_retriable::no,
    invalidates_metadata::no
);
const kafka_error_code kafka_error_code::NO_REASSIGNMENT_IN_PROGRESS (
    85,
    "NO_REASSIGNMENT_IN_PROGRESS",
    "No partition reassignment is in progress.",
    is_retriable::no,
    invalidates_metadata::no
);

}

}
