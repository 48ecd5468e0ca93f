/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <boost/test/unit_test.hpp>
#include <seastar/testing/thread_test_case.hh>
#include <seastar/core/smp.hh>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "streaming/stream_config.hh"

using namespace streaming;

SEASTAR_THREAD_TEST_CASE(test_decode_defaults) {
    auto cfg = stream_config::decode(YAML::Node());
    BOOST_REQUIRE_EQUAL(cfg.connections_per_host, 1u);
    BOOST_REQUIRE_EQUAL(cfg.connection_establisher_parallelism, 0u);
    BOOST_REQUIRE_EQUAL(cfg.max_connect_attempts, 3u);
    BOOST_REQUIRE_EQUAL(cfg.connect_retry_delay.count(), 1000);
    BOOST_REQUIRE_GE(cfg.establisher_parallelism(), 1u);

    auto root = YAML::Load("cluster_name: test\n");
    auto partial = stream_config::decode(root["streaming"]);
    BOOST_REQUIRE_EQUAL(partial.connections_per_host, 1u);
}

SEASTAR_THREAD_TEST_CASE(test_decode_values) {
    auto root = YAML::Load(
            "streaming:\n"
            "  connections_per_host: 4\n"
            "  connection_establisher_parallelism: 8\n"
            "  max_connect_attempts: 5\n"
            "  connect_retry_delay_in_ms: 250\n"
            "  broadcast_address: 10.0.0.7\n");
    auto cfg = stream_config::decode(root["streaming"]);
    BOOST_REQUIRE_EQUAL(cfg.connections_per_host, 4u);
    BOOST_REQUIRE_EQUAL(cfg.establisher_parallelism(), 8u);
    BOOST_REQUIRE_EQUAL(cfg.max_connect_attempts, 5u);
    BOOST_REQUIRE_EQUAL(cfg.connect_retry_delay.count(), 250);
    BOOST_REQUIRE(cfg.broadcast_address == gms::inet_address("10.0.0.7"));
}

SEASTAR_THREAD_TEST_CASE(test_decode_rejects_malformed_values) {
    BOOST_REQUIRE_THROW(stream_config::decode(YAML::Load("[1, 2]")), std::invalid_argument);
    BOOST_REQUIRE_THROW(stream_config::decode(YAML::Load("connections_per_host: many")), std::invalid_argument);
    BOOST_REQUIRE_THROW(stream_config::decode(YAML::Load("max_connect_attempts: 0")), std::invalid_argument);
    BOOST_REQUIRE_THROW(stream_config::decode(YAML::Load("broadcast_address: not-an-address")), std::invalid_argument);
}

SEASTAR_THREAD_TEST_CASE(test_decode_bounds_connect_attempts) {
    auto cfg = stream_config::decode(YAML::Load(fmt::format("max_connect_attempts: {}", stream_config::max_connect_attempts_limit)));
    BOOST_REQUIRE_EQUAL(cfg.max_connect_attempts, stream_config::max_connect_attempts_limit);
    BOOST_REQUIRE_THROW(stream_config::decode(YAML::Load("max_connect_attempts: 34")), std::invalid_argument);
    BOOST_REQUIRE_THROW(stream_config::decode(YAML::Load("max_connect_attempts: 4294967295")), std::invalid_argument);
}

SEASTAR_THREAD_TEST_CASE(test_establisher_parallelism_is_split_across_shards) {
    stream_config cfg;
    BOOST_REQUIRE_EQUAL(cfg.establisher_parallelism(), size_t(smp::count));

    cfg.connection_establisher_parallelism = 10;
    size_t total = 0;
    for (unsigned shard = 0; shard < 4; ++shard) {
        total += cfg.establisher_parallelism_of_shard(shard, 4);
    }
    BOOST_REQUIRE_EQUAL(total, 10u);
    BOOST_REQUIRE_EQUAL(cfg.establisher_parallelism_of_shard(0, 4), 3u);
    BOOST_REQUIRE_EQUAL(cfg.establisher_parallelism_of_shard(3, 4), 2u);

    // A shard never ends up unable to connect.
    cfg.connection_establisher_parallelism = 2;
    BOOST_REQUIRE_EQUAL(cfg.establisher_parallelism_of_shard(5, 8), 1u);

    cfg.connection_establisher_parallelism = 0;
    total = 0;
    for (unsigned shard = 0; shard < smp::count; ++shard) {
        total += cfg.establisher_parallelism_of_shard(shard, smp::count);
    }
    BOOST_REQUIRE_EQUAL(total, size_t(smp::count));
}
