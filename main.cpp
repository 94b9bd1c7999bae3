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

#include <iostream>

#include <seastar/core/app-template.hh>
#include <seastar/core/thread.hh>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <rfalter/admin/admin_properties.hh>
#include <rfalter/admin/alter_replication_factor.hh>
#include <rfalter/admin/kafka_cluster_gateway.hh>
#include <rfalter/placement/errors.hh>
#include <rfalter/utils/defaults.hh>
#include <rfalter/utils/logger.hh>

using namespace seastar;

namespace bpo = boost::program_options;

namespace {

constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;

void print_report(const rfalter::alter_request& request, const rfalter::alter_result& result) {
    fmt::print("Current Assignments:\n");
    for (const auto& partition : result.current) {
        fmt::print("[{}]\n", fmt::join(partition.replicas, ", "));
    }

    fmt::print("Reassignments:\n");
    for (const auto& [tp, replicas] : result.proposed) {
        fmt::print("partition {}: [{}]\n", tp.partition, fmt::join(replicas, ", "));
    }

    if (result.submitted) {
        fmt::print("Replication factor for topic {} updated to {}\n", request.topic, request.replication_factor);
    } else if (result.proposed.empty()) {
        fmt::print("Nothing to reassign: topic {} has no partitions\n", request.topic);
    } else {
        fmt::print("Dry run: reassignment for topic {} was not submitted\n", request.topic);
    }
}

}

int main(int ac, char** av) {
    app_template::config app_cfg;
    app_cfg.name = "kafka-alter-rf";
    app_cfg.description = "A simple utility to alter the replication factor of a topic, "
                          "spreading replicas across racks";
    app_template app(std::move(app_cfg));
    const auto strategy_help = fmt::format("Replica placement strategy, one of: {}",
            fmt::join(rfalter::strategies::names(), ", "));
    app.add_options()
        ("bootstrap-server,b", bpo::value<std::string>()->default_value(rfalter::defaults::BOOTSTRAP_SERVERS),
            "List of Kafka bootstrap servers")
        ("command-config", bpo::value<std::string>()->default_value(""),
            "Config file containing properties like the client id, timeouts, etc")
        ("topic,t", bpo::value<std::string>(), "Topic to alter replication factor on")
        ("replication-factor,r", bpo::value<int32_t>(), "New replication factor")
        ("strategy", bpo::value<std::string>()->default_value(rfalter::strategies::ROUND_ROBIN_ACROSS_RACKS),
            strategy_help.c_str())
        ("dry-run", bpo::bool_switch()->default_value(false), "Print the reassignment without submitting it");

    return app.run(ac, av, [&app] {
        return seastar::async([&app] {
            auto&& config = app.configuration();
            if (!config.count("topic") || !config.count("replication-factor")) {
                std::cerr << "Missing required options: --topic and --replication-factor\n";
                return EXIT_USAGE;
            }

            rfalter::alter_request request;
            request.topic = config["topic"].as<std::string>();
            request.replication_factor = config["replication-factor"].as<int32_t>();
            request.strategy = config["strategy"].as<std::string>();
            request.dry_run_enabled = rfalter::dry_run(config["dry-run"].as<bool>());

            try {
                auto properties = rfalter::load_admin_properties(
                        config["bootstrap-server"].as<std::string>(),
                        config["command-config"].as<std::string>());

                rfalter::kafka_cluster_gateway gateway(std::move(properties));
                auto result = gateway.init().then([&gateway, &request] {
                    return rfalter::alter_replication_factor(gateway, request);
                }).finally([&gateway] {
                    return gateway.disconnect();
                }).get();

                print_report(request, result);
                return 0;
            } catch (rfalter::configuration_error& e) {
                std::cerr << e.what() << "\n";
                return EXIT_USAGE;
            } catch (std::exception& e) {
                rfalter::rflog().error("Altering replication factor of {} failed: {}", request.topic, e.what());
                std::cerr << "A fatal exception has occurred: " << e.what() << "\n";
                return EXIT_FATAL;
            }
        });
    });
}
