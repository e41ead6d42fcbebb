/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Licensed as a Redpanda Enterprise file under the Redpanda Community
 * License (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 * https://github.com/redpanda-data/redpanda/blob/master/licenses/rcl.md
 */

#include "offload/blob_backed_read_handle.h"

#include "base/vlog.h"
#include "cloud_io/io_result.h"
#include "offload/blob_backed_input_stream.h"
#include "offload/errc.h"
#include "offload/logger.h"

#include <seastar/core/coroutine.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/coroutine/as_future.hh>

#include <algorithm>
#include <exception>
#include <ostream>
#include <system_error>

namespace offload {

namespace {

/// What the parse loop does with the record it just read.
enum class record_action {
    /// The entry the read waits for.
    accept,
    /// Earlier entry of the block the cursor is in, step over the payload.
    skip,
    /// The cursor is in the wrong place, go to the expected entry.
    reposition,
    /// Past the last entry of the ledger.
    overshoot,
};

record_action classify(
  const index_block& index,
  model::entry_id found,
  model::entry_id expected,
  model::entry_id last) {
    if (found == expected) {
        return record_action::accept;
    }
    if (found > expected && found <= last) {
        return record_action::reposition;
    }
    if (found < expected) {
        return index.same_segment(found, expected) ? record_action::skip
                                                   : record_action::reposition;
    }
    return record_action::overshoot;
}

/// A missing object in the middle of a read means the ledger is gone.
std::error_code translate(std::error_code ec) {
    if (ec == cloud_io::download_result::notfound) {
        return errc::no_such_ledger;
    }
    return ec;
}

} // namespace

std::ostream& operator<<(std::ostream& o, blob_backed_read_handle::state s) {
    switch (s) {
    case blob_backed_read_handle::state::opened:
        return o << "opened";
    case blob_backed_read_handle::state::closed:
        return o << "closed";
    }
    return o << "unknown";
}

ss::future<result<ss::shared_ptr<blob_backed_read_handle>>>
blob_backed_read_handle::open(
  cloud_io::blob_store& store,
  open_params params,
  const configuration& cfg,
  version_check check,
  offset_cache& offsets,
  offloader_stats& stats) {
    prefix_logger ctxlog(
      offload_log,
      fmt::format("[ledger {} of {}]", params.ledger, params.topic));
    const auto attempts = std::max<size_t>(cfg.index_fetch_attempts, 1);

    std::optional<index_block> index;
    std::error_code last_error = errc::no_such_ledger;
    for (size_t attempt = 1; attempt <= attempts && !index; ++attempt) {
        auto start = ss::lowres_clock::now();
        auto res = co_await store.get_blob(params.bucket, params.index_key);
        if (res.has_error()) {
            last_error = res.error();
            vlog(
              ctxlog.warn,
              "Failed to fetch index {} (attempt {}/{}): {}",
              params.index_key,
              attempt,
              attempts,
              last_error.message());
            continue;
        }
        stats.record_index_read_latency(
          params.topic, ss::lowres_clock::now() - start);

        auto blob = std::move(res.value());
        if (auto ec = check(params.index_key, blob.metadata); ec) {
            co_await blob.payload.close();
            vlog(
              ctxlog.error,
              "Index {} has unsupported format: {}",
              params.index_key,
              ec.message());
            co_return ec;
        }

        std::exception_ptr ep;
        std::optional<result<index_block>> decoded;
        try {
            decoded = co_await index_block::decode(blob.payload);
        } catch (const std::system_error& e) {
            last_error = e.code();
            vlog(
              ctxlog.warn,
              "Failed to read index {} (attempt {}/{}): {}",
              params.index_key,
              attempt,
              attempts,
              e.what());
        } catch (...) {
            ep = std::current_exception();
        }
        co_await blob.payload.close();
        if (ep) {
            std::rethrow_exception(ep);
        }
        if (!decoded) {
            continue;
        }
        if (decoded->has_error()) {
            last_error = decoded->error();
            vlog(
              ctxlog.warn,
              "Failed to decode index {} (attempt {}/{}): {}",
              params.index_key,
              attempt,
              attempts,
              last_error.message());
            continue;
        }
        index.emplace(std::move(decoded->value()));
    }

    if (!index) {
        auto ec = translate(last_error);
        vlog(
          ctxlog.error,
          "Giving up on index {} after {} attempts: {}",
          params.index_key,
          attempts,
          ec.message());
        co_return ec;
    }

    vlog(
      ctxlog.debug,
      "Opened with {} index entries, data object {} is {} bytes, {}",
      index->size(),
      params.data_key,
      index->data_object_length(),
      index->metadata());

    auto stream = std::make_unique<blob_backed_input_stream>(
      store,
      params.bucket,
      params.data_key,
      std::move(check),
      index->data_object_length(),
      cfg.read_ahead_size,
      stats,
      params.topic);

    co_return ss::make_shared<blob_backed_read_handle>(
      private_tag{},
      params.ledger,
      std::move(*index),
      std::move(stream),
      offsets,
      std::move(params.topic));
}

blob_backed_read_handle::blob_backed_read_handle(
  private_tag,
  model::ledger_id ledger,
  index_block index,
  std::unique_ptr<backed_input_stream> stream,
  offset_cache& offsets,
  ss::sstring topic)
  : _ledger_id(ledger)
  , _index(std::move(index))
  , _stream(std::move(stream))
  , _offsets(offsets)
  , _ctxlog(offload_log, fmt::format("[ledger {} of {}]", ledger, topic))
  , _read_mutex(fmt::format("offload::read_handle::{}", ledger))
  , _last_access(ss::lowres_system_clock::now()) {}

ss::future<result<model::ledger_entries>>
blob_backed_read_handle::read_async(
  model::entry_id first, model::entry_id last) {
    auto self = shared_from_this();
    vlog(_ctxlog.debug, "Reading entries {} - {}", first, last);

    ++_pending_reads;
    auto fut = co_await ss::coroutine::as_future(do_read(first, last));
    _last_access = ss::lowres_system_clock::now();
    --_pending_reads;
    co_return fut.get();
}

ss::future<result<model::ledger_entries>>
blob_backed_read_handle::read_unconfirmed_async(
  model::entry_id first, model::entry_id last) {
    return read_async(first, last);
}

ss::future<result<model::ledger_entries>>
blob_backed_read_handle::do_read(model::entry_id first, model::entry_id last) {
    if (first() < 0 || first > last || last > last_add_confirmed()) {
        vlog(
          _ctxlog.debug,
          "Invalid range {} - {}, last add confirmed {}",
          first,
          last,
          last_add_confirmed());
        co_return errc::invalid_parameter;
    }

    auto units = co_await _read_mutex.get_units();
    if (_state == state::closed) {
        vlog(_ctxlog.debug, "Read {} - {} on a closed handle", first, last);
        co_return errc::handle_closed;
    }

    // A failed read can leave the cursor anywhere, even in the middle of a
    // record. Only a completed read ends on a record boundary.
    _cursor_valid = false;
    try {
        auto res = co_await read_entries(first, last);
        _cursor_valid = res.has_value();
        co_return res;
    } catch (const std::system_error& e) {
        vlog(_ctxlog.warn, "Failed to read {} - {}: {}", first, last, e.what());
        co_return translate(e.code());
    }
}

ss::future<result<model::ledger_entries>>
blob_backed_read_handle::read_entries(
  model::entry_id first, model::entry_id last) {
    model::ledger_entries entries;
    auto expected = first;
    auto remaining = last() - first() + 1;
    // Only one correction for reading past the end of the ledger.
    bool overshoot_corrected = false;
    // Last seek target with no entry accepted since. Landing on the same
    // position again can't make progress.
    std::optional<uint64_t> stalled_at;

    auto reposition = [&](model::entry_id id) -> bool {
        auto target = seek_to_entry(id);
        if (stalled_at == target) {
            return false;
        }
        stalled_at = target;
        return true;
    };

    if (!_cursor_valid || _stream->available() < format::record_header_size) {
        vlog(
          _ctxlog.trace,
          "{} bytes buffered, cursor {}, seeking to entry {}",
          _stream->available(),
          _cursor_valid ? "valid" : "invalid",
          first);
        reposition(first);
    }

    while (remaining > 0) {
        const auto record_position = _stream->position();
        const auto length = co_await _stream->read_be<int32_t>();
        if (length < 0) {
            // Block padding. The next block starts at an offset recorded in
            // the index, not right after this word.
            vlog(
              _ctxlog.trace,
              "End of block at {}, seeking to entry {}",
              record_position,
              expected);
            if (!reposition(expected)) {
                vlog(
                  _ctxlog.error,
                  "Entry {} points at block padding at {}",
                  expected,
                  record_position);
                co_return errc::unexpected_condition;
            }
            continue;
        }
        const auto found = model::entry_id(
          co_await _stream->read_be<int64_t>());
        if (
          found < model::entry_id(0)
          || uint64_t(length)
               > _index.data_object_length() - _stream->position()) {
            // Not a record header, the cursor is inside a record or a block
            // header.
            vlog(
              _ctxlog.warn,
              "No record at {} (length {}, entry {}), seeking to entry {}",
              record_position,
              length,
              found,
              expected);
            if (!reposition(expected)) {
                vlog(
                  _ctxlog.error,
                  "Entry {} points at invalid record at {}",
                  expected,
                  record_position);
                co_return errc::unexpected_condition;
            }
            continue;
        }

        switch (classify(_index, found, expected, last)) {
        case record_action::accept: {
            _offsets.put(_ledger_id, found, int64_t(record_position));
            auto payload = co_await _stream->read_exactly(size_t(length));
            entries.push_back(model::ledger_entry{
              .ledger = _ledger_id,
              .id = found,
              .payload = std::move(payload),
            });
            stalled_at.reset();
            ++expected;
            --remaining;
            break;
        }
        case record_action::skip:
            _stream->skip(uint64_t(length));
            break;
        case record_action::reposition:
            vlog(
              _ctxlog.warn,
              "Found entry {} at {} while expecting {}, seeking",
              found,
              record_position,
              expected);
            if (!reposition(expected)) {
                vlog(
                  _ctxlog.error,
                  "No progress reading entry {} at {}",
                  expected,
                  record_position);
                co_return errc::unexpected_condition;
            }
            break;
        case record_action::overshoot:
            if (overshoot_corrected) {
                vlog(
                  _ctxlog.info,
                  "Found entry {} past the requested {} again, expecting {}",
                  found,
                  last,
                  expected);
                co_return errc::unexpected_condition;
            }
            vlog(
              _ctxlog.warn,
              "Found entry {} past the requested {}, seeking to {}",
              found,
              last,
              expected);
            overshoot_corrected = true;
            stalled_at = seek_to_entry(expected);
            break;
        }
    }
    co_return entries;
}

uint64_t blob_backed_read_handle::seek_to_entry(model::entry_id id) {
    if (auto known = _offsets.get(_ledger_id, id); known) {
        vlog(_ctxlog.trace, "Entry {} cached at {}", id, *known);
        _stream->seek(uint64_t(*known));
        return uint64_t(*known);
    }
    // Throws std::system_error if the entry isn't in the ledger.
    auto entry = _index.lookup(id).value();
    vlog(_ctxlog.trace, "Entry {} is in block {}", id, entry);
    _stream->seek(uint64_t(entry.data_offset));
    return uint64_t(entry.data_offset);
}

ss::future<result<model::entry_id>>
blob_backed_read_handle::read_last_add_confirmed_async() {
    co_return last_add_confirmed();
}

ss::future<result<model::entry_id>>
blob_backed_read_handle::try_read_last_add_confirmed_async() {
    co_return last_add_confirmed();
}

ss::future<result<last_confirmed_and_entry>>
blob_backed_read_handle::read_last_add_confirmed_and_entry_async(
  model::entry_id, std::chrono::milliseconds, bool) {
    co_return errc::unsupported_operation;
}

ss::future<> blob_backed_read_handle::close() {
    if (!_close_future) {
        _state = state::closed;
        _close_future.emplace(do_close());
    }
    return _close_future->get_future();
}

ss::future<> blob_backed_read_handle::do_close() {
    auto self = shared_from_this();
    auto units = co_await _read_mutex.get_units();
    co_await _stream->close();
    _owner_holder.reset();
    vlog(_ctxlog.debug, "Closed");
}

} // namespace offload
