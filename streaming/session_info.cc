/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "streaming/session_info.hh"
#include <stdexcept>

namespace streaming {

void session_info::update_progress(progress_info new_progress) {
    if (peer != new_progress.peer || session_index != new_progress.session_index) {
        throw std::invalid_argument(fmt::format("Progress for {} ID#{} applied to session info of {} ID#{}",
                new_progress.peer, new_progress.session_index, peer, session_index));
    }
    auto& current_files = new_progress.dir == progress_info::direction::IN
        ? receiving_files : sending_files;
    auto file_name = new_progress.file_name;
    current_files[std::move(file_name)] = std::move(new_progress);
}

std::vector<progress_info> session_info::get_receiving_files() const {
    std::vector<progress_info> ret;
    for (auto const& x : receiving_files) {
        ret.push_back(x.second);
    }
    return ret;
}

std::vector<progress_info> session_info::get_sending_files() const {
    std::vector<progress_info> ret;
    for (auto const& x : sending_files) {
        ret.push_back(x.second);
    }
    return ret;
}

long session_info::get_total_size_in_progress(std::vector<progress_info> files) const {
    long total = 0;
    for (auto const& file : files) {
        total += file.current_bytes;
    }
    return total;
}

long session_info::get_total_files(std::vector<stream_summary> const& summaries) const {
    long total = 0;
    for (auto const& summary : summaries) {
        total += summary.files;
    }
    return total;
}

long session_info::get_total_sizes(std::vector<stream_summary> const& summaries) const {
    long total = 0;
    for (auto const& summary : summaries)
        total += summary.total_size;
    return total;
}

long session_info::get_total_files_completed(std::vector<progress_info> files) const {
    long size = 0;
    for (auto const& x : files) {
        if (x.is_completed()) {
            size++;
        }
    }
    return size;
}

} // namespace streaming

auto fmt::formatter<streaming::session_info>::format(const streaming::session_info& x, fmt::format_context& ctx) const
        -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "[peer={}, ID#{}, state={}, files received={}/{}, files sent={}/{}]",
            x.peer, x.session_index, x.state,
            x.get_total_files_received(), x.get_total_files_to_receive(),
            x.get_total_files_sent(), x.get_total_files_to_send());
}
