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

#include <rfalter/admin/alter_replication_factor.hh>
#include <rfalter/placement/validation.hh>
#include <rfalter/utils/logger.hh>

#include <seastar/core/do_with.hh>

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace seastar;

namespace rfalter {

future<alter_result> alter_replication_factor(cluster_gateway& gateway, alter_request request) {
    return do_with(std::move(request), std::vector<broker>(), alter_result(),
            [&gateway] (alter_request& request, std::vector<broker>& brokers, alter_result& result) {
        return gateway.list_brokers().then([&gateway, &request, &brokers] (std::vector<broker> live_brokers) {
            brokers = std::move(live_brokers);
            validate_replication_factor(brokers, request.replication_factor);
            return gateway.list_partitions(request.topic);
        }).then([&gateway, &request, &brokers, &result] (std::vector<partition_info> partitions) {
            result.current = partitions;

            auto strategy = make_reassignment_strategy(request.strategy, request.topic, brokers,
                    std::move(partitions), request.replication_factor);
            result.proposed = strategy->reassignments();
            for (const auto& [tp, replicas] : result.proposed) {
                rflog().info("{}-{} -> [{}]", tp.topic, tp.partition, fmt::join(replicas, ", "));
            }

            if (request.dry_run_enabled || result.proposed.empty()) {
                return make_ready_future<>();
            }
            return gateway.submit_reassignment(result.proposed).then([&result] {
                result.submitted = true;
            });
        }).then([&result] {
            return std::move(result);
        });
    });
}

}
