/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "streaming/progress_info.hh"

auto fmt::formatter<streaming::progress_info>::format(const streaming::progress_info& x, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    std::string_view dir = x.dir == streaming::progress_info::direction::OUT ? "sent to" : "received from";
    // An empty file is done as soon as it is announced.
    float percentage = x.total_bytes > 0 ? x.current_bytes * 100.F / x.total_bytes : 100.F;
    return fmt::format_to(ctx.out(), "{} {:d}/{:d} ({:.1f}%) {} {} ID#{}", x.file_name, x.current_bytes, x.total_bytes,
            percentage, dir, x.peer, x.session_index);
}
