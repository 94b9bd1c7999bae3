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

namespace rfalter {

class reassignable_partition_response {
public:
    kafka_int32_t _partition_index;
    kafka_error_code_t _error_code;
    kafka_compact_nullable_string_t _error_message;
    kafka_tagged_fields_t _tagged_fields;

    void serialize(std::ostream& os, int16_t api_version) const;

    void deserialize(std::istream& is, int16_t api_version);
};

class reassignable_topic_response {
public:
    kafka_compact_string_t _name;
    kafka_compact_array_t<reassignable_partition_response> _partitions;
    kafka_tagged_fields_t _tagged_fields;

    void serialize(std::ostream& os, int16_t api_version) const;

    void deserialize(std::istream& is, int16_t api_version);
};

class alter_partition_reassignments_response {
public:
    kafka_int32_t _throttle_time_ms;
    kafka_error_code_t _error_code;
    kafka_compact_nullable_string_t _error_message;
    kafka_compact_array_t<reassignable_topic_response> _responses;
    kafka_tagged_fields_t _tagged_fields;

    void serialize(std::ostream& os, int16_t api_version) const;

    void deserialize(std::istream& is, int16_t api_version);
};

}
