/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include "gms/inet_address.hh"

namespace YAML {
class Node;
}

namespace streaming {

struct stream_config {
    static constexpr unsigned max_connect_attempts_limit = 30;

    // Connections multiplexed per peer by a sending plan.
    unsigned connections_per_host = 1;
    // Concurrent connection establishments of the whole node; 0 means one per reactor shard.
    unsigned connection_establisher_parallelism = 0;
    unsigned max_connect_attempts = 3;
    // Delay before the second attempt, doubled for each further one.
    std::chrono::milliseconds connect_retry_delay{1000};
    gms::inet_address broadcast_address;

    size_t establisher_parallelism() const;

    // Share of establisher_parallelism() given to one shard. The shares add
    // up to the node-wide bound; every shard gets at least one.
    size_t establisher_parallelism_of_shard(unsigned shard, unsigned shard_count) const;

    // Reads the `streaming` section of the node configuration. Keys that
    // are absent keep their defaults.
    static stream_config decode(const YAML::Node& node);
};

} // namespace streaming
