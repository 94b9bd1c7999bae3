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

using namespace seastar;

namespace rfalter {

// Request header v1, or v2 (trailing tagged fields) for flexible versions.
// The client id stays a classic nullable string in both.
class request_header {
public:
    kafka_int16_t _api_key;
    kafka_int16_t _api_version;
    kafka_int32_t _correlation_id;
    kafka_nullable_string_t _client_id;
    kafka_tagged_fields_t _tagged_fields;

    void serialize(std::ostream& os, int16_t header_version) const;

    void deserialize(std::istream& is, int16_t header_version);
};

// Response header v0, or v1 (trailing tagged fields) for flexible versions.
class response_header {
public:
    kafka_int32_t _correlation_id;
    kafka_tagged_fields_t _tagged_fields;

    void serialize(std::ostream& os, int16_t header_version) const;

    void deserialize(std::istream& is, int16_t header_version);
};

template<typename RequestType>
constexpr int16_t request_header_version(int16_t api_version) noexcept {
    return api_version >= RequestType::FIRST_FLEXIBLE_VERSION ? 2 : 1;
}

template<typename RequestType>
constexpr int16_t response_header_version(int16_t api_version) noexcept {
    return api_version >= RequestType::FIRST_FLEXIBLE_VERSION ? 1 : 0;
}

}
