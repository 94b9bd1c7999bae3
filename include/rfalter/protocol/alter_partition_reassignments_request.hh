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

#include <rfalter/protocol/kafka_primitives.hh>
#include <rfalter/protocol/alter_partition_reassignments_response.hh>

using namespace seastar;

namespace rfalter {

class reassignable_partition {
public:
    kafka_int32_t _partition_index;
    // Null cancels a pending reassignment of the partition.
    kafka_compact_array_t<kafka_int32_t> _replicas;
    kafka_tagged_fields_t _tagged_fields;

    void serialize(std::ostream& os, int16_t api_version) const;

    void deserialize(std::istream& is, int16_t api_version);
};

class reassignable_topic {
public:
    kafka_compact_string_t _name;
    kafka_compact_array_t<reassignable_partition> _partitions;
    kafka_tagged_fields_t _tagged_fields;

    void serialize(std::ostream& os, int16_t api_version) const;

    void deserialize(std::istream& is, int16_t api_version);
};

// Must be sent to the controller. Available since Kafka 2.4.
class alter_partition_reassignments_request {
public:
    using response_type = alter_partition_reassignments_response;
    static constexpr int16_t API_KEY = 45;
    static constexpr int16_t MIN_SUPPORTED_VERSION = 0;
    static constexpr int16_t MAX_SUPPORTED_VERSION = 0;
    static constexpr int16_t FIRST_FLEXIBLE_VERSION = 0;

    kafka_int32_t _timeout_ms;
    kafka_compact_array_t<reassignable_topic> _topics;
    kafka_tagged_fields_t _tagged_fields;

    void serialize(std::ostream& os, int16_t api_version) const;

    void deserialize(std::istream& is, int16_t api_version);
};

}
