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

#include "cloud_io/blob_store.h"
#include "offload/backed_input_stream.h"
#include "offload/format.h"
#include "offload/offloader_stats.h"
#include "utils/prefix_logger.h"

#include <seastar/core/sstring.hh>

namespace offload {

/// \brief Backed input stream over a data object in the blob store
///
/// Holds one window of the object in memory. A read that leaves the window
/// fetches the next read_ahead_size bytes starting at the cursor with a
/// single ranged request. Seeking inside the window is free, seeking outside
/// drops it and the next read fetches again.
class blob_backed_input_stream final : public backed_input_stream {
public:
    struct probe {
        size_t fetches{0};
        size_t seeks{0};
        uint64_t bytes_fetched{0};
        uint64_t bytes_skipped{0};
    };

    blob_backed_input_stream(
      cloud_io::blob_store& store,
      cloud_io::bucket_name bucket,
      cloud_io::object_key key,
      version_check check,
      uint64_t object_length,
      size_t read_ahead_size,
      offloader_stats& stats,
      ss::sstring topic);

    ss::future<ss::temporary_buffer<char>> read_exactly(size_t n) override;
    void seek(uint64_t position) override;
    void skip(uint64_t n) override;
    uint64_t position() const override { return _position; }
    size_t available() const override;
    ss::future<> close() override;

    uint64_t object_length() const { return _object_length; }
    const probe& get_probe() const { return _probe; }

private:
    bool in_window() const;
    void maybe_drop_window();
    ss::future<> fill();

    cloud_io::blob_store& _store;
    cloud_io::bucket_name _bucket;
    cloud_io::object_key _key;
    version_check _version_check;
    uint64_t _object_length;
    size_t _read_ahead_size;
    offloader_stats& _stats;
    ss::sstring _topic;
    prefix_logger _ctxlog;

    ss::temporary_buffer<char> _window;
    uint64_t _window_start{0};
    uint64_t _position{0};
    bool _closed{false};
    probe _probe;
};

} // namespace offload
