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
#include <set>

namespace streaming {

/**
 * Task that manages receiving files for the session for certain table.
 */
class stream_receive_task : public stream_task {
private:
    // number of files to receive
    int _total_files;
    // total size of files to receive
    int64_t _total_size;
    std::set<sstring> _received;
public:
    stream_receive_task(sstring table_, int total_files, int64_t total_size);
    ~stream_receive_task();

    /**
     * Records a received file.
     *
     * @return false if the file was already received
     */
    bool received(const sstring& file_name);

    virtual int get_total_number_of_files() const override {
        return _total_files;
    }

    virtual int64_t get_total_size() const override {
        return _total_size;
    }

    virtual bool is_completed() const override {
        return int(_received.size()) >= _total_files;
    }

    virtual void abort() override {
        _received.clear();
    }
};

} // namespace streaming
