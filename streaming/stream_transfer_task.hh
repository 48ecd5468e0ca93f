/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "streaming/stream_task.hh"
#include <map>
#include <vector>

namespace streaming {

// One unit of outbound work: a file of a table, identified by name.
struct outgoing_file {
    sstring name;
    int64_t size = 0;
};

/**
 * StreamTransferTask sends the files of one table. A file stays pending
 * until the peer acknowledges it.
 */
class stream_transfer_task : public stream_task {
private:
    std::vector<outgoing_file> _files;
    std::map<sstring, int64_t> _pending;
    int64_t _total_size = 0;
public:
    explicit stream_transfer_task(sstring table_);
    ~stream_transfer_task();

    // Throws std::invalid_argument if a file of that name was already added.
    void add_file(outgoing_file file);

    const std::vector<outgoing_file>& files() const {
        return _files;
    }

    /**
     * Marks a file as received by the peer.
     *
     * @return the size of the acknowledged file
     * @throws std::runtime_error if the file is not pending
     */
    int64_t complete(const sstring& file_name);

    virtual int get_total_number_of_files() const override {
        return _files.size();
    }

    virtual int64_t get_total_size() const override {
        return _total_size;
    }

    virtual bool is_completed() const override {
        return _pending.empty();
    }

    virtual void abort() override;
};

} // namespace streaming
