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
#include "cloud_io/blob_store.h"
#include "model/ledger.h"
#include "offload/backed_input_stream.h"
#include "offload/configuration.h"
#include "offload/format.h"
#include "offload/index_block.h"
#include "offload/ledger_read_handle.h"
#include "offload/offloader_stats.h"
#include "offload/offset_cache.h"
#include "utils/mutex.h"
#include "utils/prefix_logger.h"

#include <seastar/core/gate.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>

#include <fmt/ostream.h>

#include <iosfwd>
#include <memory>
#include <optional>

namespace offload {

namespace testing_details {
struct read_handle_accessor;
} // namespace testing_details

/// \brief Read handle of a ledger offloaded to the blob store
///
/// The handle owns the decoded index object and a backed input stream over
/// the data object. Reads are executed one at a time in submission order,
/// every read parses records sequentially from the stream and repositions
/// the cursor through the shard wide offset cache or the index whenever the
/// parse is not where it expects to be.
///
/// Instances are created by open() only, so a live handle always holds a
/// valid index.
class blob_backed_read_handle final
  : public ledger_read_handle
  , public offloaded_ledger_handle
  , public ss::enable_shared_from_this<blob_backed_read_handle> {
    struct private_tag {};

public:
    enum class state { opened, closed };

    struct open_params {
        cloud_io::bucket_name bucket;
        cloud_io::object_key data_key;
        cloud_io::object_key index_key;
        model::ledger_id ledger;
        /// Display name used in logs and stats
        ss::sstring topic;
    };

    /// Fetch and decode the index object, then build the handle.
    ///
    /// Fetching and decoding is attempted up to index_fetch_attempts times.
    /// A version mismatch fails immediately. If all attempts failed because
    /// the object is missing the result is errc::no_such_ledger, otherwise
    /// it's the error of the last attempt.
    static ss::future<result<ss::shared_ptr<blob_backed_read_handle>>> open(
      cloud_io::blob_store& store,
      open_params params,
      const configuration& cfg,
      version_check check,
      offset_cache& offsets,
      offloader_stats& stats);

    blob_backed_read_handle(
      private_tag,
      model::ledger_id ledger,
      index_block index,
      std::unique_ptr<backed_input_stream> stream,
      offset_cache& offsets,
      ss::sstring topic);

    model::ledger_id id() const final { return _ledger_id; }
    const model::ledger_metadata& ledger_metadata() const final {
        return _index.metadata();
    }

    ss::future<result<model::ledger_entries>>
    read_async(model::entry_id first, model::entry_id last) final;

    /// Offloaded ledgers are sealed, same as read_async.
    ss::future<result<model::ledger_entries>>
    read_unconfirmed_async(model::entry_id first, model::entry_id last) final;

    ss::future<result<model::entry_id>> read_last_add_confirmed_async() final;
    ss::future<result<model::entry_id>>
    try_read_last_add_confirmed_async() final;

    /// Always fails with errc::unsupported_operation.
    ss::future<result<last_confirmed_and_entry>>
    read_last_add_confirmed_and_entry_async(
      model::entry_id entry,
      std::chrono::milliseconds timeout,
      bool parallel) final;

    model::entry_id last_add_confirmed() const final {
        return _index.last_entry_id();
    }
    uint64_t length() const final { return _index.metadata().length; }
    /// Sealed flag of the ledger, unrelated to the state of the handle.
    bool is_closed() const final { return _index.metadata().closed; }

    /// Stop accepting reads and release the stream once the read in
    /// progress, if any, has finished. Every call returns a future that
    /// resolves when that single close has completed.
    ss::future<> close() final;

    /// Keep \p holder until the handle is closed. The owner of the offset
    /// cache passes a holder of its gate so it can't stop while the handle
    /// still uses the cache.
    void hold_until_closed(ss::gate::holder holder) {
        _owner_holder.emplace(std::move(holder));
    }

    timestamp last_access_timestamp() const final { return _last_access; }
    size_t pending_reads() const final { return _pending_reads; }

private:
    friend struct testing_details::read_handle_accessor;

    ss::future<result<model::ledger_entries>>
    do_read(model::entry_id first, model::entry_id last);

    ss::future<result<model::ledger_entries>>
    read_entries(model::entry_id first, model::entry_id last);

    /// Position the cursor at the record of \p id, or at the start of the
    /// block that holds it. Returns the new position.
    uint64_t seek_to_entry(model::entry_id id);

    ss::future<> do_close();

    model::ledger_id _ledger_id;
    index_block _index;
    std::unique_ptr<backed_input_stream> _stream;
    offset_cache& _offsets;
    prefix_logger _ctxlog;

    /// Reads and close run one at a time in arrival order.
    mutex _read_mutex;
    state _state{state::opened};
    /// False when the cursor may not be on a record boundary.
    bool _cursor_valid{false};
    size_t _pending_reads{0};
    timestamp _last_access;
    std::optional<ss::shared_future<>> _close_future;
    std::optional<ss::gate::holder> _owner_holder;
};

std::ostream& operator<<(std::ostream&, blob_backed_read_handle::state);

} // namespace offload

template<>
struct fmt::formatter<offload::blob_backed_read_handle::state>
  : fmt::ostream_formatter {};
