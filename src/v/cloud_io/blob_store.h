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

#include "base/outcome.h"
#include "base/seastarx.h"
#include "cloud_io/io_result.h"
#include "utils/absl_sstring_hash.h"
#include "utils/named_type.h"

#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/sstring.hh>

#include <absl/container/flat_hash_map.h>
#include <fmt/ostream.h>

#include <cstdint>
#include <iosfwd>
#include <optional>

namespace cloud_io {

using bucket_name = named_type<ss::sstring, struct cloud_io_bucket_name_tag>;
using object_key = named_type<ss::sstring, struct cloud_io_object_key_tag>;

/// Inclusive byte range, same semantics as the HTTP Range header.
struct byte_range {
    uint64_t first{0};
    uint64_t last{0};

    uint64_t size() const { return last - first + 1; }

    friend bool operator==(const byte_range&, const byte_range&) = default;
    friend std::ostream& operator<<(std::ostream&, const byte_range&);
};

using user_metadata_map
  = absl::flat_hash_map<ss::sstring, ss::sstring, sstring_hash, sstring_eq>;

struct blob_metadata {
    object_key key;
    /// Size of the payload that was returned, not of the whole object.
    uint64_t content_length{0};
    /// Size of the whole object.
    uint64_t object_size{0};
    /// User metadata attached at upload time. Keys are lower case.
    user_metadata_map user_metadata;
};

/// Object (or part of it) returned by the store. The consumer owns the
/// payload stream and must close it.
struct blob {
    blob_metadata metadata;
    ss::input_stream<char> payload;
};

/// \brief Read side of an object store
///
/// Implementations are stateless per call so a single instance can be
/// shared by every reader of a shard. Missing objects fail with
/// download_result::notfound, all other transport problems with
/// download_result::timedout or download_result::failed. Nothing is retried
/// at this level.
class blob_store {
public:
    blob_store() = default;
    virtual ~blob_store() = default;
    blob_store(const blob_store&) = delete;
    blob_store(blob_store&&) = delete;
    blob_store& operator=(const blob_store&) = delete;
    blob_store& operator=(blob_store&&) = delete;

    /// \brief Fetch an object
    /// \param range restricts the payload to a byte range of the object,
    ///        the whole object is returned when it is not set
    virtual ss::future<result<blob>> get_blob(
      const bucket_name& bucket,
      const object_key& key,
      std::optional<byte_range> range = std::nullopt)
      = 0;
};

} // namespace cloud_io

template<>
struct fmt::formatter<cloud_io::byte_range> : fmt::ostream_formatter {};
