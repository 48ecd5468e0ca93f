/*
 * Copyright (C) 2018-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "streaming/stream_reason.hh"

auto fmt::formatter<streaming::stream_reason>::format(streaming::stream_reason r, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    using enum streaming::stream_reason;
    std::string_view name = "unknown";
    switch (r) {
    case unspecified:
        name = "unspecified";
        break;
    case bootstrap:
        name = "bootstrap";
        break;
    case decommission:
        name = "decommission";
        break;
    case removenode:
        name = "removenode";
        break;
    case rebuild:
        name = "rebuild";
        break;
    case repair:
        name = "repair";
        break;
    case replace:
        name = "replace";
        break;
    case rebalance:
        name = "rebalance";
        break;
    }
    return formatter<string_view>::format(name, ctx);
}
