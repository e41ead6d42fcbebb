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

#include <seastar/core/byteorder.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/temporary_buffer.hh>

#include <cstdint>

namespace offload {

/// \brief Seekable byte source over one remote object
///
/// The cursor is owned by a single reader and is not safe to interleave, so
/// callers serialize their use of the stream. Failures are reported as
/// std::system_error carrying either an offload::errc (end of stream,
/// version mismatch) or the cloud_io::download_result of the failed fetch.
/// Nothing is retried by the stream.
class backed_input_stream {
public:
    backed_input_stream() = default;
    backed_input_stream(const backed_input_stream&) = delete;
    backed_input_stream& operator=(const backed_input_stream&) = delete;
    backed_input_stream(backed_input_stream&&) = delete;
    backed_input_stream& operator=(backed_input_stream&&) = delete;
    virtual ~backed_input_stream() = default;

    /// Returns exactly \p n bytes starting at the cursor and advances it.
    virtual ss::future<ss::temporary_buffer<char>> read_exactly(size_t n) = 0;

    /// Moves the cursor to an absolute position. No I/O.
    virtual void seek(uint64_t position) = 0;

    /// Advances the cursor without materializing the bytes. No I/O.
    virtual void skip(uint64_t n) = 0;

    virtual uint64_t position() const = 0;

    /// Bytes that can be read without a remote fetch.
    virtual size_t available() const = 0;

    virtual ss::future<> close() = 0;

    template<typename T>
    ss::future<T> read_be() {
        auto buf = co_await read_exactly(sizeof(T));
        co_return ss::read_be<T>(buf.get());
    }
};

} // namespace offload
