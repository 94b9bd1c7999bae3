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

#include <rfalter/connection/tcp_connection.hh>
#include <rfalter/utils/logger.hh>

#include <seastar/core/with_timeout.hh>
#include <seastar/net/dns.hh>

using namespace seastar;

namespace rfalter {

static auto timeout_end(uint32_t timeout_ms) {
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
}

future<tcp_connection> tcp_connection::connect(const seastar::sstring& host, uint16_t port,
        uint32_t timeout_ms) {
    auto resolved = net::dns::resolve_name(host);
    return seastar::with_timeout(timeout_end(timeout_ms), std::move(resolved))
    .then([host, port, timeout_ms] (net::inet_address target_host) {
        rflog().debug("Connecting to {}:{} ({})", host, port, target_host);
        auto f = seastar::connect(socket_address(target_host, port), {}, transport::TCP);
        return seastar::with_timeout(timeout_end(timeout_ms), std::move(f))
        .then([target_host, timeout_ms, port] (connected_socket fd) {
            return tcp_connection(target_host, port, timeout_ms, std::move(fd));
        });
    });
}

future<temporary_buffer<char>> tcp_connection::read(size_t bytes_to_read) {
    auto f = _read_buf.read_exactly(bytes_to_read)
        .then([this, bytes_to_read](temporary_buffer<char> data) {
            if (data.size() != bytes_to_read) {
                _fd.shutdown_input();
                _fd.shutdown_output();
                throw tcp_connection_exception("Connection ended prematurely");
            }
            return data;
        });
    return seastar::with_timeout(timeout_end(_timeout_ms), std::move(f));
}

future<> tcp_connection::write(temporary_buffer<char> buff) {
    auto f = _write_buf.write(std::move(buff)).then([this] {
        return _write_buf.flush();
    });
    return seastar::with_timeout(timeout_end(_timeout_ms), std::move(f));
}

future<> tcp_connection::close() {
    return when_all_succeed(_read_buf.close(), _write_buf.close())
    .discard_result().handle_exception([this](std::exception_ptr ep) {
        rflog().debug("Error closing connection to {}:{}: {}", _host, _port, ep);
    });
}

}
