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

#include <string>
#include <cstdint>
#include <seastar/core/sstring.hh>
#include <seastar/util/bool_class.hh>

using namespace seastar;

namespace rfalter {

namespace error {

struct is_retriable_tag {};
using is_retriable = bool_class<is_retriable_tag>;

struct invalidates_metadata_tag {};
using invalidates_metadata = bool_class<invalidates_metadata_tag>;

class kafka_error_code {

public:

    int16_t _error_code;
    seastar::sstring _error_name;
    seastar::sstring _error_message;
    is_retriable _is_retriable;
    invalidates_metadata _invalidates_metadata;

    kafka_error_code(
        int16_t error_code,
        seastar::sstring error_name,
        seastar::sstring error_message,
        is_retriable is_retriable,
        invalidates_metadata invalidates_metadata);

    // Codes this client does not know resolve to UNKNOWN_SERVER_ERROR.
    static const kafka_error_code& get_error(int16_t value) noexcept;

    static const kafka_error_code UNKNOWN_SERVER_ERROR;
    static const kafka_error_code NONE;
    static const kafka_error_code CORRUPT_MESSAGE;
    static const kafka_error_code UNKNOWN_TOPIC_OR_PARTITION;
    static const kafka_error_code LEADER_NOT_AVAILABLE;
    static const kafka_error_code NOT_LEADER_OR_FOLLOWER;
    static const kafka_error_code REQUEST_TIMED_OUT;
    static const kafka_error_code BROKER_NOT_AVAILABLE;
    static const kafka_error_code REPLICA_NOT_AVAILABLE;
    static const kafka_error_code NETWORK_EXCEPTION;
    static const kafka_error_code INVALID_TOPIC_EXCEPTION;
    static const kafka_error_code TOPIC_AUTHORIZATION_FAILED;
    static const kafka_error_code CLUSTER_AUTHORIZATION_FAILED;
    static const kafka_error_code UNSUPPORTED_VERSION;
    static const kafka_error_code INVALID_REPLICATION_FACTOR;
    static const kafka_error_code INVALID_REPLICA_ASSIGNMENT;
    static const kafka_error_code NOT_CONTROLLER;
    static const kafka_error_code INVALID_REQUEST;
    static const kafka_error_code POLICY_VIOLATION;
    static const kafka_error_code KAFKA_STORAGE_ERROR;
    static const kafka_error_code REASSIGNMENT_IN_PROGRESS;
    static const kafka_error_code NO_REASSIGNMENT_IN_PROGRESS;
};

}

}
