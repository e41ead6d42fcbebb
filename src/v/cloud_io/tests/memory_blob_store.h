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

#include <seastar/core/shared_future.hh>
#include <seastar/core/temporary_buffer.hh>

#include <absl/container/flat_hash_map.h>

#include <deque>
#include <optional>
#include <vector>

namespace cloud_io {

/// In-memory object store used by tests. Counts every request, can fail
/// requests on demand and can hold requests in flight until resumed.
class memory_blob_store final : public blob_store {
public:
    struct request {
        bucket_name bucket;
        object_key key;
        std::optional<byte_range> range;
    };

    void put(
      const bucket_name& bucket,
      const object_key& key,
      ss::temporary_buffer<char> body,
      user_metadata_map metadata = {});

    void erase(const bucket_name& bucket, const object_key& key);

    void set_user_metadata(
      const bucket_name& bucket,
      const object_key& key,
      ss::sstring name,
      ss::sstring value);

    /// The next \p times requests for \p key fail with \p r before the
    /// object is looked up.
    void
    inject_failure(const object_key& key, download_result r, size_t times = 1);

    /// The payload of the next request for \p key breaks with
    /// download_result::failed after \p after_bytes were delivered.
    void inject_stream_failure(const object_key& key, size_t after_bytes);

    /// Payloads are delivered in buffers of at most this many bytes.
    void set_chunk_size(size_t sz) { _chunk_size = sz; }

    /// Requests block until resume() is called.
    void pause();
    void resume();
    size_t paused_requests() const { return _paused_requests; }

    size_t requests() const { return _history.size(); }
    size_t requests(const object_key& key) const;
    size_t ranged_requests(const object_key& key) const;
    const std::vector<request>& history() const { return _history; }
    void reset_history() { _history.clear(); }

    ss::future<result<blob>> get_blob(
      const bucket_name& bucket,
      const object_key& key,
      std::optional<byte_range> range = std::nullopt) override;

private:
    struct object {
        ss::temporary_buffer<char> body;
        user_metadata_map metadata;
    };

    static ss::sstring path(const bucket_name& bucket, const object_key& key);

    absl::flat_hash_map<ss::sstring, object, sstring_hash, sstring_eq> _objects;
    absl::flat_hash_map<
      ss::sstring,
      std::deque<download_result>,
      sstring_hash,
      sstring_eq>
      _failures;
    absl::flat_hash_map<ss::sstring, size_t, sstring_hash, sstring_eq>
      _stream_failures;
    std::vector<request> _history;
    std::optional<ss::shared_promise<>> _pause;
    size_t _paused_requests{0};
    size_t _chunk_size{4096};
};

} // namespace cloud_io
