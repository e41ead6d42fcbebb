/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Licensed as a Redpanda Enterprise file under the Redpanda Community
 * License (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 * https://github.com/redpanda-data/redpanda/blob/master/licenses/rcl.md
 */

#include "offload/blob_backed_input_stream.h"

#include "base/vlog.h"
#include "offload/errc.h"
#include "offload/logger.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/lowres_clock.hh>

#include <algorithm>
#include <cstring>
#include <exception>
#include <system_error>

namespace offload {

blob_backed_input_stream::blob_backed_input_stream(
  cloud_io::blob_store& store,
  cloud_io::bucket_name bucket,
  cloud_io::object_key key,
  version_check check,
  uint64_t object_length,
  size_t read_ahead_size,
  offloader_stats& stats,
  ss::sstring topic)
  : _store(store)
  , _bucket(std::move(bucket))
  , _key(std::move(key))
  , _version_check(std::move(check))
  , _object_length(object_length)
  , _read_ahead_size(std::max(read_ahead_size, format::record_header_size))
  , _stats(stats)
  , _topic(std::move(topic))
  , _ctxlog(offload_log, fmt::format("{}/{}", _bucket, _key)) {}

bool blob_backed_input_stream::in_window() const {
    return _position >= _window_start
           && _position < _window_start + _window.size();
}

void blob_backed_input_stream::maybe_drop_window() {
    if (!_window.empty() && !in_window()) {
        _window = {};
    }
}

size_t blob_backed_input_stream::available() const {
    if (!in_window()) {
        return 0;
    }
    return _window_start + _window.size() - _position;
}

void blob_backed_input_stream::seek(uint64_t position) {
    vlog(_ctxlog.trace, "seek from {} to {}", _position, position);
    ++_probe.seeks;
    _position = position;
    maybe_drop_window();
}

void blob_backed_input_stream::skip(uint64_t n) {
    _probe.bytes_skipped += n;
    _position += n;
    maybe_drop_window();
}

ss::future<ss::temporary_buffer<char>>
blob_backed_input_stream::read_exactly(size_t n) {
    if (_closed) {
        throw std::system_error(
          make_error_code(errc::handle_closed), "stream is closed");
    }
    if (n == 0) {
        co_return ss::temporary_buffer<char>();
    }
    if (available() >= n) {
        auto buf = _window.share(_position - _window_start, n);
        _position += n;
        co_return buf;
    }

    ss::temporary_buffer<char> out(n);
    size_t copied = 0;
    while (copied < n) {
        if (available() == 0) {
            co_await fill();
        }
        auto take = std::min(n - copied, available());
        std::memcpy(
          out.get_write() + copied, // NOLINT
          _window.get() + (_position - _window_start), // NOLINT
          take);
        copied += take;
        _position += take;
    }
    co_return out;
}

ss::future<> blob_backed_input_stream::fill() {
    if (_position >= _object_length) {
        throw std::system_error(
          make_error_code(errc::end_of_stream),
          fmt::format(
            "read at {} past the end of {} ({} bytes)",
            _position,
            _key,
            _object_length));
    }
    cloud_io::byte_range range{
      .first = _position,
      .last = std::min<uint64_t>(_position + _read_ahead_size, _object_length)
              - 1,
    };
    vlog(_ctxlog.trace, "fetching {}", range);

    auto start = ss::lowres_clock::now();
    auto res = co_await _store.get_blob(_bucket, _key, range);
    if (res.has_error()) {
        _stats.record_read_error(_topic);
        vlog(
          _ctxlog.warn, "failed to fetch {}: {}", range, res.error().message());
        throw std::system_error(
          res.error(), fmt::format("fetching {} of {}", range, _key));
    }

    auto blob = std::move(res.value());
    std::error_code ec = _version_check(_key, blob.metadata);
    std::exception_ptr ep;
    ss::temporary_buffer<char> buf;
    if (!ec) {
        try {
            buf = co_await blob.payload.read_exactly(range.size());
        } catch (...) {
            ep = std::current_exception();
        }
    }
    co_await blob.payload.close();

    if (ec) {
        _stats.record_read_error(_topic);
        throw std::system_error(ec, fmt::format("version check of {}", _key));
    }
    if (ep) {
        _stats.record_read_error(_topic);
        vlog(_ctxlog.warn, "payload of {} failed: {}", range, ep);
        std::rethrow_exception(ep);
    }
    if (buf.size() < range.size()) {
        _stats.record_read_error(_topic);
        throw std::system_error(
          make_error_code(cloud_io::download_result::failed),
          fmt::format(
            "short read of {}: {} of {} bytes", range, buf.size(), range.size()));
    }

    _stats.record_data_read_latency(_topic, ss::lowres_clock::now() - start);
    _stats.record_read_bytes(_topic, buf.size());
    ++_probe.fetches;
    _probe.bytes_fetched += buf.size();
    _window = std::move(buf);
    _window_start = range.first;
}

ss::future<> blob_backed_input_stream::close() {
    vlog(_ctxlog.debug, "closing at position {}", _position);
    _closed = true;
    _window = {};
    co_return;
}

} // namespace offload
