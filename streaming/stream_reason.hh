/*
 * Copyright (C) 2018-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <string_view>
#include <fmt/format.h>

namespace streaming {

enum class stream_reason : uint8_t {
    unspecified,
    bootstrap,
    decommission,
    removenode,
    rebuild,
    repair,
    replace,
    rebalance,
};

}

template <>
struct fmt::formatter<streaming::stream_reason> : fmt::formatter<string_view> {
    auto format(streaming::stream_reason, fmt::format_context& ctx) const -> decltype(ctx.out());
};
