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
#include <seastar/core/lowres_clock.hh>

#include <chrono>
#include <optional>

namespace offload {

struct last_confirmed_and_entry {
    model::entry_id last_add_confirmed;
    std::optional<model::ledger_entry> entry;
};

/// \brief Random access read interface of a ledger
///
/// The broker's dispatcher and replay logic read through this interface no
/// matter whether a ledger is still in the hot tier or was offloaded.
class ledger_read_handle {
public:
    ledger_read_handle() = default;
    ledger_read_handle(const ledger_read_handle&) = delete;
    ledger_read_handle& operator=(const ledger_read_handle&) = delete;
    ledger_read_handle(ledger_read_handle&&) = delete;
    ledger_read_handle& operator=(ledger_read_handle&&) = delete;
    virtual ~ledger_read_handle() = default;

    virtual model::ledger_id id() const = 0;
    virtual const model::ledger_metadata& ledger_metadata() const = 0;

    /// Entries [first, last] in increasing entry id order. A failed read
    /// never returns part of the range.
    virtual ss::future<result<model::ledger_entries>>
    read_async(model::entry_id first, model::entry_id last) = 0;

    virtual ss::future<result<model::ledger_entries>>
    read_unconfirmed_async(model::entry_id first, model::entry_id last) = 0;

    virtual ss::future<result<model::entry_id>>
    read_last_add_confirmed_async() = 0;

    virtual ss::future<result<model::entry_id>>
    try_read_last_add_confirmed_async() = 0;

    virtual ss::future<result<last_confirmed_and_entry>>
    read_last_add_confirmed_and_entry_async(
      model::entry_id entry, std::chrono::milliseconds timeout, bool parallel)
      = 0;

    virtual model::entry_id last_add_confirmed() const = 0;
    virtual uint64_t length() const = 0;
    virtual bool is_closed() const = 0;

    virtual ss::future<> close() = 0;
};

/// Hooks watched by the idle handle eviction of the ledger handle cache.
class offloaded_ledger_handle {
public:
    using timestamp = ss::lowres_system_clock::time_point;

    offloaded_ledger_handle() = default;
    offloaded_ledger_handle(const offloaded_ledger_handle&) = delete;
    offloaded_ledger_handle& operator=(const offloaded_ledger_handle&) = delete;
    offloaded_ledger_handle(offloaded_ledger_handle&&) = delete;
    offloaded_ledger_handle& operator=(offloaded_ledger_handle&&) = delete;
    virtual ~offloaded_ledger_handle() = default;

    /// Completion time of the last read, or creation time of the handle if
    /// nothing was read yet. Never moves while a read is in flight.
    virtual timestamp last_access_timestamp() const = 0;

    /// Reads submitted but not yet completed.
    virtual size_t pending_reads() const = 0;
};

} // namespace offload
