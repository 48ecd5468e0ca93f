/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "streaming/stream_message.hh"
#include <seastar/util/variant_utils.hh>

auto fmt::formatter<streaming::stream_message>::format(const streaming::stream_message& msg, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    return std::visit(seastar::make_visitor(
        [&] (const streaming::stream_init_message& m) {
            return fmt::format_to(ctx.out(), "STREAM_INIT(from={}, ID#{}, plan={}, reason={})", m.from, m.session_index, m.plan_id, m.reason);
        },
        [&] (const streaming::prepare_message& m) {
            return fmt::format_to(ctx.out(), "PREPARE(summaries={})", m.summaries.size());
        },
        [&] (const streaming::file_message& m) {
            return fmt::format_to(ctx.out(), "FILE({}/{}, size={:d})", m.table, m.file_name, m.size);
        },
        [&] (const streaming::received_message& m) {
            return fmt::format_to(ctx.out(), "RECEIVED({}/{})", m.table, m.file_name);
        },
        [&] (const streaming::complete_message&) {
            return fmt::format_to(ctx.out(), "COMPLETE");
        },
        [&] (const streaming::session_failed_message&) {
            return fmt::format_to(ctx.out(), "SESSION_FAILED");
        }
    ), msg);
}
