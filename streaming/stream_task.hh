/*
 *
 * Modified by ScyllaDB
 * Copyright (C) 2015-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: (AGPL-3.0-or-later and Apache-2.0)
 */

#pragma once

#include "streaming/stream_summary.hh"

namespace streaming {

/**
 * StreamTask is an abstraction of the streaming task performed over specific table.
 */
class stream_task {
public:
    sstring table;

    explicit stream_task(sstring table_);
    virtual ~stream_task();

public:
    /**
     * @return total number of files this task receives/streams.
     */
    virtual int get_total_number_of_files() const = 0;

    /**
     * @return total bytes expected to receive
     */
    virtual int64_t get_total_size() const = 0;

    virtual bool is_completed() const = 0;

    /**
     * Abort the task.
     * Subclass should implement cleaning up resources.
     */
    virtual void abort() = 0;

    /**
     * @return StreamSummary that describes this task
     */
    virtual stream_summary get_summary() const {
        return stream_summary(this->table, this->get_total_number_of_files(), this->get_total_size());
    }
};

} // namespace streaming
