/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include <seastar/core/sstring.hh>
#include <fmt/core.h>
#include "seastarx.hh"

namespace streaming {

/**
 * Summary of streaming.
 */
class stream_summary {
public:
    sstring table;

    /**
     * Number of files to transfer. Can be 0 if nothing to transfer for some streaming request.
     */
    int files = 0;
    int64_t total_size = 0;

    stream_summary() = default;
    stream_summary(sstring table_, int files_, int64_t total_size_)
        : table(std::move(table_))
        , files(files_)
        , total_size(total_size_) {
    }

    friend bool operator==(const stream_summary&, const stream_summary&) = default;
};

} // namespace streaming

template <> struct fmt::formatter<streaming::stream_summary> : fmt::formatter<string_view> {
    auto format(const streaming::stream_summary&, fmt::format_context& ctx) const -> decltype(ctx.out());
};
