/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Licensed as a Redpanda Enterprise file under the Redpanda Community
 * License (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 * https://github.com/redpanda-data/redpanda/blob/master/licenses/rcl.md
 */

#include "cloud_io/tests/memory_blob_store.h"

#include "cloud_io/logger.h"
#include "base/vlog.h"

#include <seastar/core/iostream.hh>

#include <algorithm>
#include <system_error>

namespace cloud_io {

namespace {

/// Hands out a buffer in fixed size pieces, optionally breaking the stream
/// after a number of bytes.
class chunked_data_source final : public ss::data_source_impl {
public:
    chunked_data_source(
      ss::temporary_buffer<char> body,
      size_t chunk_size,
      std::optional<size_t> fail_after)
      : _body(std::move(body))
      , _chunk_size(chunk_size)
      , _fail_after(fail_after) {}

    ss::future<ss::temporary_buffer<char>> get() final {
        if (_fail_after.has_value() && _delivered >= *_fail_after) {
            return ss::make_exception_future<ss::temporary_buffer<char>>(
              std::system_error(
                make_error_code(download_result::failed),
                "injected payload failure"));
        }
        if (_body.empty()) {
            return ss::make_ready_future<ss::temporary_buffer<char>>();
        }
        auto n = std::min(_chunk_size, _body.size());
        if (_fail_after.has_value()) {
            n = std::min(n, *_fail_after - _delivered);
        }
        auto chunk = _body.share(0, n);
        _body.trim_front(n);
        _delivered += n;
        return ss::make_ready_future<ss::temporary_buffer<char>>(
          std::move(chunk));
    }

private:
    ss::temporary_buffer<char> _body;
    size_t _chunk_size;
    std::optional<size_t> _fail_after;
    size_t _delivered{0};
};

} // namespace

ss::sstring
memory_blob_store::path(const bucket_name& bucket, const object_key& key) {
    return bucket() + "/" + key();
}

void memory_blob_store::put(
  const bucket_name& bucket,
  const object_key& key,
  ss::temporary_buffer<char> body,
  user_metadata_map metadata) {
    _objects.insert_or_assign(
      path(bucket, key), object{std::move(body), std::move(metadata)});
}

void memory_blob_store::erase(
  const bucket_name& bucket, const object_key& key) {
    _objects.erase(path(bucket, key));
}

void memory_blob_store::set_user_metadata(
  const bucket_name& bucket,
  const object_key& key,
  ss::sstring name,
  ss::sstring value) {
    auto it = _objects.find(path(bucket, key));
    if (it != _objects.end()) {
        it->second.metadata.insert_or_assign(std::move(name), std::move(value));
    }
}

void memory_blob_store::inject_failure(
  const object_key& key, download_result r, size_t times) {
    auto& q = _failures[key()];
    for (size_t i = 0; i < times; ++i) {
        q.push_back(r);
    }
}

void memory_blob_store::inject_stream_failure(
  const object_key& key, size_t after_bytes) {
    _stream_failures.insert_or_assign(key(), after_bytes);
}

void memory_blob_store::pause() {
    if (!_pause) {
        _pause.emplace();
    }
}

void memory_blob_store::resume() {
    if (_pause) {
        _pause->set_value();
        _pause.reset();
    }
}

size_t memory_blob_store::requests(const object_key& key) const {
    return std::count_if(
      _history.begin(), _history.end(), [&key](const request& r) {
          return r.key == key;
      });
}

size_t memory_blob_store::ranged_requests(const object_key& key) const {
    return std::count_if(
      _history.begin(), _history.end(), [&key](const request& r) {
          return r.key == key && r.range.has_value();
      });
}

ss::future<result<blob>> memory_blob_store::get_blob(
  const bucket_name& bucket,
  const object_key& key,
  std::optional<byte_range> range) {
    _history.push_back(request{bucket, key, range});

    if (_pause) {
        ++_paused_requests;
        co_await _pause->get_shared_future();
        --_paused_requests;
    }

    if (auto f = _failures.find(key()); f != _failures.end()) {
        if (!f->second.empty()) {
            auto r = f->second.front();
            f->second.pop_front();
            vlog(cio_log.debug, "Injected failure {} for {}", r, key);
            co_return make_error_code(r);
        }
    }

    auto it = _objects.find(path(bucket, key));
    if (it == _objects.end()) {
        co_return make_error_code(download_result::notfound);
    }
    auto& obj = it->second;

    ss::temporary_buffer<char> body;
    if (range.has_value()) {
        if (range->first >= obj.body.size() || range->last < range->first) {
            vlog(
              cio_log.debug,
              "Unsatisfiable range {} for {} of size {}",
              *range,
              key,
              obj.body.size());
            co_return make_error_code(download_result::failed);
        }
        auto last = std::min<uint64_t>(range->last, obj.body.size() - 1);
        body = obj.body.share(range->first, last - range->first + 1);
    } else {
        body = obj.body.share();
    }

    std::optional<size_t> fail_after;
    if (auto sf = _stream_failures.find(key()); sf != _stream_failures.end()) {
        fail_after = sf->second;
        _stream_failures.erase(sf);
    }

    blob_metadata md{
      .key = key,
      .content_length = body.size(),
      .object_size = obj.body.size(),
      .user_metadata = obj.metadata,
    };
    co_return blob{
      .metadata = std::move(md),
      .payload = ss::input_stream<char>(
        ss::data_source(std::make_unique<chunked_data_source>(
          std::move(body), _chunk_size, fail_after))),
    };
}

} // namespace cloud_io
