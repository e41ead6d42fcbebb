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
#include "model/ledger.h"

#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>

#include <fmt/ostream.h>

#include <cstdint>
#include <iosfwd>
#include <vector>

namespace offload {

/// Position of one data block inside the data object.
struct index_entry {
    /// First entry stored in the block
    model::entry_id first_entry;
    int32_t part_id{0};
    /// Position of the block header
    int64_t block_offset{0};
    /// Position of the first record of the block
    int64_t data_offset{0};

    friend bool operator==(const index_entry&, const index_entry&) = default;
    friend std::ostream& operator<<(std::ostream&, const index_entry&);
};

/// \brief Decoded index object of an offloaded ledger
///
/// Holds the ledger metadata and a table that maps the first entry of every
/// data block to the block position. The table is sorted by entry id and
/// block positions never decrease, so lookups for increasing entry ids
/// return non-decreasing offsets. Immutable once decoded.
class index_block {
public:
    /// Decode an index object from a stream.
    ///
    /// Format problems, truncation included, fail with
    /// errc::malformed_index. Failures of the stream itself propagate as
    /// exceptional futures so that the caller can tell them apart and retry.
    static ss::future<result<index_block>> decode(ss::input_stream<char>& in);

    /// Decode an index object that is already in memory.
    static result<index_block> decode(ss::temporary_buffer<char> buf);

    const model::ledger_metadata& metadata() const { return _metadata; }
    model::entry_id last_entry_id() const { return _metadata.last_entry_id; }
    uint64_t data_object_length() const { return _data_object_length; }
    int64_t data_header_length() const { return _data_header_length; }
    size_t size() const { return _entries.size(); }

    /// Index entry of the block that holds \p id.
    ///
    /// Fails with errc::entry_out_of_range when \p id is negative or past
    /// the last entry of the ledger.
    result<index_entry> lookup(model::entry_id id) const;

    /// True if both entries are stored in the same data block.
    bool same_segment(model::entry_id a, model::entry_id b) const;

private:
    index_block() = default;

    /// Returns an empty string if the table is consistent, the reason
    /// otherwise.
    ss::sstring validate() const;

    model::ledger_metadata _metadata;
    uint64_t _data_object_length{0};
    int64_t _data_header_length{0};
    std::vector<index_entry> _entries;
};

} // namespace offload

template<>
struct fmt::formatter<offload::index_entry> : fmt::ostream_formatter {};
