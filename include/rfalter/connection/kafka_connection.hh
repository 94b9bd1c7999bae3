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

#include <rfalter/connection/tcp_connection.hh>
#include <rfalter/protocol/headers.hh>
#include <rfalter/protocol/api_versions_request.hh>
#include <rfalter/protocol/api_versions_response.hh>
#include <rfalter/utils/logger.hh>

#include <seastar/core/semaphore.hh>

#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/array.hpp>

#include <vector>

using namespace seastar;

namespace rfalter {

class kafka_connection final {

    tcp_connection _connection;
    seastar::sstring _client_id;
    int32_t _correlation_id;
    api_versions_response _api_versions;
    semaphore _send_semaphore;
    semaphore _receive_semaphore;

    template<typename RequestType>
    temporary_buffer<char> serialize_request(const RequestType& request, int32_t correlation_id, int16_t api_version) {
        std::vector<char> message;
        boost::iostreams::back_insert_device<std::vector<char>> sink(message);
        boost::iostreams::stream<boost::iostreams::back_insert_device<std::vector<char>>> message_stream(sink);

        // Size prefix, patched once the message is complete.
        kafka_int32_t message_size(0);
        message_size.serialize(message_stream, 0);

        request_header req_header;
        req_header._api_key = RequestType::API_KEY;
        req_header._api_version = api_version;
        req_header._correlation_id = correlation_id;
        req_header._client_id = _client_id;
        req_header.serialize(message_stream, request_header_version<RequestType>(api_version));

        request.serialize(message_stream, api_version);
        message_stream.flush();

        auto size = net::hton(static_cast<int32_t>(message.size() - sizeof(int32_t)));
        std::memcpy(message.data(), &size, sizeof(int32_t));

        return temporary_buffer<char>{message.data(), message.size()};
    }

    future<> send_request(temporary_buffer<char> message_buffer) {
        return _connection.write(std::move(message_buffer));
    }

    template<typename RequestType>
    future<typename RequestType::response_type> receive_response(int32_t correlation_id, int16_t api_version) {
        return _connection.read(4).then([] (temporary_buffer<char> response_size) {
            boost::iostreams::stream<boost::iostreams::array_source> response_size_stream(
                    response_size.get(), response_size.size());

            kafka_int32_t size;
            size.deserialize(response_size_stream, 0);
            if (*size < 0) {
                throw parsing_exception("Received negative response size");
            }
            return *size;
        }).then([this] (int32_t response_size) {
            return _connection.read(response_size);
        }).then([correlation_id, api_version] (temporary_buffer<char> response) {
            boost::iostreams::stream<boost::iostreams::array_source> response_stream(
                    response.get(), response.size());

            response_header response_header;
            response_header.deserialize(response_stream, response_header_version<RequestType>(api_version));
            if (*response_header._correlation_id != correlation_id) {
                throw parsing_exception("Received invalid correlation id");
            }

            typename RequestType::response_type deserialized_response;
            deserialized_response.deserialize(response_stream, api_version);

            return deserialized_response;
        });
    }

    template<typename ResponseType>
    static ResponseType error_response(const error::kafka_error_code& error) {
        ResponseType response;
        response._error_code = error;
        return response;
    }

    future<> init();

public:
    static future<std::unique_ptr<kafka_connection>> connect(const seastar::sstring& host, uint16_t port,
            const seastar::sstring& client_id, uint32_t timeout_ms);

    kafka_connection(tcp_connection connection, seastar::sstring client_id) :
        _connection(std::move(connection)),
        _client_id(std::move(client_id)),
        _correlation_id(0),
        _send_semaphore(1),
        _receive_semaphore(1) {}

    kafka_connection(kafka_connection&& other) = default;
    kafka_connection(kafka_connection& other) = delete;

    future<> close();

    template<typename RequestType>
    future<typename RequestType::response_type> send(RequestType request) {
        int16_t api_version;
        try {
            api_version = _api_versions.max_version<RequestType>();
        } catch (unsupported_version_exception& e) {
            return make_ready_future<typename RequestType::response_type>(
                    error_response<typename RequestType::response_type>(error::kafka_error_code::UNSUPPORTED_VERSION));
        }
        return send(std::move(request), api_version);
    }

    template<typename RequestType>
    future<typename RequestType::response_type> send(RequestType request, int16_t api_version) {
        auto correlation_id = _correlation_id++;
        auto serialized_message = serialize_request(request, correlation_id, api_version);

        // In order to preserve ordering of sends, two semaphores with
        // count = 1 are used due to its FIFO guarantees.
        //
        // Send and receive are always queued jointly,
        // so that receive will get response from correct
        // request. Kafka guarantees that responses will
        // be sent in the same order that requests were sent.
        (void) with_semaphore(_send_semaphore, 1,
        [this, serialized_message = std::move(serialized_message)]() mutable {
            return send_request(std::move(serialized_message));
        }).handle_exception([] (std::exception_ptr ep) {
            // The matching receive fails or times out and reports the error.
            rflog().debug("Sending request failed: {}", ep);
        });
        return with_semaphore(_receive_semaphore, 1, [this, correlation_id, api_version] {
            return receive_response<RequestType>(correlation_id, api_version);
        }).handle_exception([] (std::exception_ptr ep) {
            using response_type = typename RequestType::response_type;
            try {
                std::rethrow_exception(ep);
            } catch (seastar::timed_out_error& e) {
                return error_response<response_type>(error::kafka_error_code::REQUEST_TIMED_OUT);
            } catch (parsing_exception& e) {
                rflog().warn("Malformed response: {}", e.what());
                return error_response<response_type>(error::kafka_error_code::CORRUPT_MESSAGE);
            } catch (std::exception& e) {
                rflog().debug("Request failed: {}", e.what());
                return error_response<response_type>(error::kafka_error_code::NETWORK_EXCEPTION);
            }
        });
    }
};

}
