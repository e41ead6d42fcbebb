/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Licensed as a Redpanda Enterprise file under the Redpanda Community
 * License (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 * https://github.com/redpanda-data/redpanda/blob/master/licenses/rcl.md
 */

#pragma once

#include "base/seastarx.h"

#include <seastar/core/sstring.hh>

#include <chrono>
#include <cstddef>

namespace offload {

/// Observer of read path activity, keyed by topic. Calls are fire and forget
/// and never influence the read that reports them.
class offloader_stats {
public:
    using duration = std::chrono::nanoseconds;

    offloader_stats() = default;
    offloader_stats(const offloader_stats&) = delete;
    offloader_stats& operator=(const offloader_stats&) = delete;
    offloader_stats(offloader_stats&&) = delete;
    offloader_stats& operator=(offloader_stats&&) = delete;
    virtual ~offloader_stats() = default;

    /// Time spent fetching one index object
    virtual void
    record_index_read_latency(const ss::sstring& topic, duration latency)
      = 0;
    /// Time spent fetching one window of a data object
    virtual void
    record_data_read_latency(const ss::sstring& topic, duration latency)
      = 0;
    virtual void record_read_bytes(const ss::sstring& topic, size_t bytes) = 0;
    virtual void record_read_error(const ss::sstring& topic) = 0;
};

class null_offloader_stats final : public offloader_stats {
public:
    void record_index_read_latency(const ss::sstring&, duration) final {}
    void record_data_read_latency(const ss::sstring&, duration) final {}
    void record_read_bytes(const ss::sstring&, size_t) final {}
    void record_read_error(const ss::sstring&) final {}
};

} // namespace offload
