/*
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <yaml-cpp/yaml.h>
#include <seastar/core/smp.hh>
#include <algorithm>
#include <boost/lexical_cast.hpp>
#include <stdexcept>
#include "streaming/stream_config.hh"

namespace streaming {

size_t stream_config::establisher_parallelism() const {
    if (connection_establisher_parallelism) {
        return connection_establisher_parallelism;
    }
    return smp::count;
}

size_t stream_config::establisher_parallelism_of_shard(unsigned shard, unsigned shard_count) const {
    auto total = establisher_parallelism();
    shard_count = std::max(shard_count, 1u);
    auto share = total / shard_count + (shard < total % shard_count ? 1 : 0);
    return std::max<size_t>(share, 1);
}

stream_config stream_config::decode(const YAML::Node& node) {
    stream_config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw std::invalid_argument(fmt::format("Could not decode stream_config: {}", boost::lexical_cast<std::string>(node)));
    }
    auto get_opt = [&node] (const std::string& key, auto def) {
        auto tmp = node[key];
        try {
            return tmp ? tmp.template as<std::decay_t<decltype(def)>>() : def;
        } catch (const YAML::Exception& e) {
            throw std::invalid_argument(fmt::format("Invalid value for streaming.{}: {}", key, e.what()));
        }
    };
    cfg.connections_per_host = get_opt("connections_per_host", cfg.connections_per_host);
    cfg.connection_establisher_parallelism = get_opt("connection_establisher_parallelism", cfg.connection_establisher_parallelism);
    cfg.max_connect_attempts = get_opt("max_connect_attempts", cfg.max_connect_attempts);
    cfg.connect_retry_delay = std::chrono::milliseconds(get_opt("connect_retry_delay_in_ms", int64_t(cfg.connect_retry_delay.count())));
    auto broadcast_address = get_opt("broadcast_address", std::string());
    if (!broadcast_address.empty()) {
        cfg.broadcast_address = gms::inet_address(sstring(broadcast_address));
    }
    if (cfg.max_connect_attempts == 0 || cfg.max_connect_attempts > max_connect_attempts_limit) {
        throw std::invalid_argument(fmt::format("streaming.max_connect_attempts must be in [1, {}], got {}",
                max_connect_attempts_limit, cfg.max_connect_attempts));
    }
    return cfg;
}

} // namespace streaming
