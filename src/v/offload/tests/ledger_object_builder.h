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
#include "cloud_io/blob_store.h"
#include "cloud_io/tests/memory_blob_store.h"
#include "model/ledger.h"
#include "offload/index_block.h"

#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

#include <absl/container/btree_map.h>

#include <cstdint>
#include <vector>

namespace offload::tests {

/// Writes the data and index objects of an offloaded ledger.
///
/// Entries are appended in id order and packed into blocks of block_size
/// bytes, every block is padded to its full size. Raw records let tests
/// write layouts that a healthy offloader never would.
class ledger_object_builder {
public:
    explicit ledger_object_builder(size_t block_size = 256);

    /// Appends the next entry of the ledger. Starts a new block when the
    /// record doesn't fit into the current one.
    ledger_object_builder& append(ss::sstring payload);

    /// Appends \p count entries with payloads of \p payload_size bytes, see
    /// payload_for().
    ledger_object_builder& append_many(size_t count, size_t payload_size);

    /// Writes a record with an arbitrary id into the current block. The
    /// ledger doesn't advance and the index doesn't know about it.
    ledger_object_builder& append_raw(model::entry_id id, ss::sstring payload);

    /// The next record starts a new block.
    ledger_object_builder& seal_block();

    /// Metadata written to the index. Last entry id and length are derived
    /// from the appended entries.
    model::ledger_metadata& metadata() { return _metadata; }

    ss::temporary_buffer<char> data_object() const;
    ss::temporary_buffer<char> index_object() const;

    /// Index as the reader is expected to decode it.
    std::vector<index_entry> index_entries() const;

    /// Position of the record of every appended entry in the data object.
    const absl::btree_map<model::entry_id, uint64_t>& record_positions() const {
        return _positions;
    }

    model::entry_id last_entry_id() const { return _next_entry - 1; }
    size_t blocks() const { return _blocks.size(); }
    uint64_t data_object_length() const;

    /// Uploads both objects with the current format version.
    void upload(
      cloud_io::memory_blob_store& store,
      const cloud_io::bucket_name& bucket,
      const cloud_io::object_key& data_key,
      const cloud_io::object_key& index_key) const;

    /// Deterministic payload of an entry, used by append_many().
    static ss::sstring payload_for(model::entry_id id, size_t size);

private:
    struct record {
        model::entry_id id;
        ss::sstring payload;

        size_t size() const;
    };

    struct block {
        model::entry_id first_entry;
        size_t used{0};
        std::vector<record> records;
    };

    block& block_for(size_t record_size);
    uint64_t block_length(const block& b) const;
    model::ledger_metadata effective_metadata() const;

    size_t _block_size;
    std::vector<block> _blocks;
    bool _sealed{true};
    model::entry_id _next_entry{0};
    uint64_t _payload_bytes{0};
    model::ledger_metadata _metadata;
    absl::btree_map<model::entry_id, uint64_t> _positions;
};

} // namespace offload::tests
