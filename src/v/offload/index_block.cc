/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Licensed as a Redpanda Enterprise file under the Redpanda Community
 * License (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 * https://github.com/redpanda-data/redpanda/blob/master/licenses/rcl.md
 */

#include "offload/index_block.h"

#include "base/vassert.h"
#include "base/vlog.h"
#include "offload/errc.h"
#include "offload/format.h"
#include "offload/logger.h"

#include <seastar/core/byteorder.hh>
#include <seastar/core/coroutine.hh>

#include <fmt/ostream.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace offload {

namespace {

/// Sequential big endian reader over a buffer. Throws std::out_of_range when
/// the buffer is too short.
class be_parser {
public:
    explicit be_parser(const ss::temporary_buffer<char>& buf)
      : _data(buf.get())
      , _size(buf.size()) {}

    template<typename T>
    T consume() {
        ensure(sizeof(T));
        auto v = ss::read_be<T>(_data + _pos); // NOLINT
        _pos += sizeof(T);
        return v;
    }

    ss::sstring consume_string(int32_t len) {
        if (len < 0) {
            throw std::out_of_range(fmt::format("negative length {}", len));
        }
        ensure(len);
        ss::sstring s(_data + _pos, len); // NOLINT
        _pos += len;
        return s;
    }

    size_t bytes_consumed() const { return _pos; }

private:
    void ensure(size_t n) const {
        if (_size - _pos < n) {
            throw std::out_of_range(fmt::format(
              "{} bytes needed at position {}, {} left", n, _pos, _size - _pos));
        }
    }

    const char* _data;
    size_t _size;
    size_t _pos{0};
};

model::ledger_metadata consume_ledger_metadata(be_parser& p, int32_t len) {
    auto start = p.bytes_consumed();
    auto version = p.consume<int32_t>();
    if (version != format::ledger_metadata_version) {
        throw std::out_of_range(
          fmt::format("unknown ledger metadata version {}", version));
    }
    model::ledger_metadata md;
    md.last_entry_id = model::entry_id(p.consume<int64_t>());
    md.length = p.consume<int64_t>();
    md.closed = p.consume<int8_t>() != 0;
    md.ensemble_size = p.consume<int32_t>();
    md.write_quorum_size = p.consume<int32_t>();
    md.ack_quorum_size = p.consume<int32_t>();
    md.ctime_ms = p.consume<int64_t>();
    auto custom = p.consume<int32_t>();
    if (custom < 0) {
        throw std::out_of_range(
          fmt::format("negative custom metadata count {}", custom));
    }
    for (int32_t i = 0; i < custom; ++i) {
        auto k = p.consume_string(p.consume<int32_t>());
        auto v = p.consume_string(p.consume<int32_t>());
        md.custom_metadata.insert_or_assign(std::move(k), std::move(v));
    }
    if (p.bytes_consumed() - start != static_cast<size_t>(len)) {
        throw std::out_of_range(fmt::format(
          "ledger metadata is {} bytes, header says {}",
          p.bytes_consumed() - start,
          len));
    }
    return md;
}

} // namespace

std::ostream& operator<<(std::ostream& o, const index_entry& e) {
    fmt::print(
      o,
      "{{first_entry: {}, part_id: {}, block_offset: {}, data_offset: {}}}",
      e.first_entry,
      e.part_id,
      e.block_offset,
      e.data_offset);
    return o;
}

ss::future<result<index_block>>
index_block::decode(ss::input_stream<char>& in) {
    auto header = co_await in.read_exactly(format::index_header_size);
    if (header.size() < format::index_header_size) {
        vlog(
          offload_log.warn,
          "Index object truncated in its header, {} bytes",
          header.size());
        co_return errc::malformed_index;
    }
    auto magic = ss::read_be<int32_t>(header.get());
    if (magic != format::index_magic) {
        vlog(offload_log.warn, "Unexpected index magic {:#x}", magic);
        co_return errc::malformed_index;
    }
    auto index_len = ss::read_be<int32_t>(header.get() + 4); // NOLINT
    if (
      index_len < 0
      || static_cast<size_t>(index_len) < format::index_header_size) {
        vlog(offload_log.warn, "Invalid index length {}", index_len);
        co_return errc::malformed_index;
    }
    auto body_len = static_cast<size_t>(index_len) - format::index_header_size;
    auto body = co_await in.read_exactly(body_len);
    if (body.size() < body_len) {
        vlog(
          offload_log.warn,
          "Index object truncated, {} of {} bytes",
          header.size() + body.size(),
          index_len);
        co_return errc::malformed_index;
    }

    ss::temporary_buffer<char> full(index_len);
    std::memcpy(full.get_write(), header.get(), header.size());
    std::memcpy(
      full.get_write() + header.size(), body.get(), body.size()); // NOLINT
    co_return decode(std::move(full));
}

result<index_block> index_block::decode(ss::temporary_buffer<char> buf) {
    index_block ix;
    try {
        be_parser p(buf);
        auto magic = p.consume<int32_t>();
        if (magic != format::index_magic) {
            vlog(offload_log.warn, "Unexpected index magic {:#x}", magic);
            return errc::malformed_index;
        }
        auto index_len = p.consume<int32_t>();
        auto data_len = p.consume<int64_t>();
        auto header_len = p.consume<int64_t>();
        auto count = p.consume<int32_t>();
        auto md_len = p.consume<int32_t>();
        if (data_len < 0 || header_len < 0 || count < 0 || md_len < 0) {
            vlog(
              offload_log.warn,
              "Negative field in index header: data length {}, header "
              "length {}, entry count {}, metadata length {}",
              data_len,
              header_len,
              count,
              md_len);
            return errc::malformed_index;
        }
        auto expected = format::index_header_size + static_cast<size_t>(md_len)
                        + static_cast<size_t>(count) * format::index_entry_size;
        if (
          index_len < 0 || static_cast<size_t>(index_len) != expected
          || buf.size() < expected) {
            vlog(
              offload_log.warn,
              "Index length {} doesn't match its content of {} bytes "
              "({} available)",
              index_len,
              expected,
              buf.size());
            return errc::malformed_index;
        }

        ix._metadata = consume_ledger_metadata(p, md_len);
        ix._data_object_length = data_len;
        ix._data_header_length = header_len;
        ix._entries.reserve(count);
        for (int32_t i = 0; i < count; ++i) {
            auto id = p.consume<int64_t>();
            auto part = p.consume<int32_t>();
            auto offset = p.consume<int64_t>();
            if (
              offset < 0
              || offset > std::numeric_limits<int64_t>::max() - header_len) {
                vlog(
                  offload_log.warn,
                  "Index entry {} has invalid block offset {}",
                  id,
                  offset);
                return errc::malformed_index;
            }
            ix._entries.push_back(index_entry{
              .first_entry = model::entry_id(id),
              .part_id = part,
              .block_offset = offset,
              .data_offset = offset + header_len,
            });
        }
    } catch (const std::out_of_range& e) {
        vlog(offload_log.warn, "Failed to decode index: {}", e.what());
        return errc::malformed_index;
    }

    if (auto reason = ix.validate(); !reason.empty()) {
        vlog(offload_log.warn, "Inconsistent index: {}", reason);
        return errc::malformed_index;
    }
    return ix;
}

ss::sstring index_block::validate() const {
    auto last = _metadata.last_entry_id;
    if (last < model::entry_id(-1)) {
        return fmt::format("last entry id {} is invalid", last);
    }
    if (last >= model::entry_id(0) && _entries.empty()) {
        return fmt::format("no index entries for last entry {}", last);
    }
    if (_entries.empty()) {
        return {};
    }
    if (_entries.front().first_entry != model::entry_id(0)) {
        return fmt::format(
          "first index entry starts at {}", _entries.front().first_entry);
    }
    if (_entries.back().first_entry > last) {
        return fmt::format(
          "index entry {} is past the last entry {}", _entries.back(), last);
    }
    for (size_t i = 0; i < _entries.size(); ++i) {
        const auto& e = _entries[i];
        if (
          e.block_offset < 0
          || static_cast<uint64_t>(e.data_offset) > _data_object_length) {
            return fmt::format(
              "index entry {} is outside of the data object of {} bytes",
              e,
              _data_object_length);
        }
        if (i == 0) {
            continue;
        }
        const auto& prev = _entries[i - 1];
        if (e.first_entry <= prev.first_entry) {
            return fmt::format("entry ids not increasing at {}", e);
        }
        if (e.block_offset < prev.block_offset) {
            return fmt::format("block offsets decreasing at {}", e);
        }
    }
    return {};
}

result<index_entry> index_block::lookup(model::entry_id id) const {
    if (id < model::entry_id(0) || id > _metadata.last_entry_id) {
        return errc::entry_out_of_range;
    }
    auto it = std::upper_bound(
      _entries.begin(),
      _entries.end(),
      id,
      [](model::entry_id v, const index_entry& e) {
          return v < e.first_entry;
      });
    vassert(
      it != _entries.begin(),
      "Entry {} precedes the first index entry, last entry {}",
      id,
      _metadata.last_entry_id);
    return *std::prev(it);
}

bool index_block::same_segment(model::entry_id a, model::entry_id b) const {
    auto ra = lookup(a);
    auto rb = lookup(b);
    if (ra.has_error() || rb.has_error()) {
        return false;
    }
    return ra.value() == rb.value();
}

} // namespace offload
