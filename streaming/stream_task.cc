/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#include "streaming/stream_task.hh"
#include "streaming/stream_transfer_task.hh"
#include "streaming/stream_receive_task.hh"
#include <stdexcept>

namespace streaming {

stream_task::stream_task(sstring table_)
    : table(std::move(table_)) {
}

stream_task::~stream_task() = default;

stream_transfer_task::stream_transfer_task(sstring table_)
    : stream_task(std::move(table_)) {
}

stream_transfer_task::~stream_transfer_task() = default;

void stream_transfer_task::add_file(outgoing_file file) {
    auto inserted = _pending.emplace(file.name, file.size).second;
    if (!inserted) {
        throw std::invalid_argument(fmt::format("File {} of table {} is already part of the transfer", file.name, table));
    }
    _total_size += file.size;
    _files.push_back(std::move(file));
}

int64_t stream_transfer_task::complete(const sstring& file_name) {
    auto it = _pending.find(file_name);
    if (it == _pending.end()) {
        throw std::runtime_error(fmt::format("Received acknowledgment for unknown file {} of table {}", file_name, table));
    }
    auto size = it->second;
    _pending.erase(it);
    return size;
}

void stream_transfer_task::abort() {
    _pending.clear();
}

stream_receive_task::stream_receive_task(sstring table_, int total_files, int64_t total_size)
    : stream_task(std::move(table_))
    , _total_files(total_files)
    , _total_size(total_size) {
}

stream_receive_task::~stream_receive_task() = default;

bool stream_receive_task::received(const sstring& file_name) {
    return _received.insert(file_name).second;
}

} // namespace streaming
