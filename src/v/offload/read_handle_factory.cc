/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Licensed as a Redpanda Enterprise file under the Redpanda Community
 * License (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 * https://github.com/redpanda-data/redpanda/blob/master/licenses/rcl.md
 */

#include "offload/read_handle_factory.h"

#include "base/vlog.h"
#include "offload/logger.h"

#include <seastar/core/coroutine.hh>

#include <algorithm>
#include <chrono>

using namespace std::chrono_literals;

namespace offload {

namespace {
// Expired offsets are also dropped on lookup, the sweep only bounds memory
// held by entries nobody asks for.
constexpr auto max_housekeeping_interval = 60s;
} // namespace

read_handle_factory::read_handle_factory(
  cloud_io::blob_store& store,
  configuration cfg,
  offloader_stats& stats,
  version_check check)
  : _store(store)
  , _config(std::move(cfg))
  , _stats(stats)
  , _version_check(std::move(check))
  , _offsets(offset_cache::config{
      .max_entries = _config.offset_cache_max_entries,
      .ttl = _config.offset_cache_ttl,
    }) {
    _housekeeping_timer.set_callback([this] { housekeeping(); });
}

ss::future<> read_handle_factory::start() {
    vlog(offload_log.info, "Starting offloaded read path with {}", _config);
    _housekeeping_timer.arm_periodic(std::min<ss::lowres_clock::duration>(
      _config.offset_cache_ttl, max_housekeeping_interval));
    return ss::now();
}

ss::future<> read_handle_factory::stop() {
    _housekeeping_timer.cancel();
    co_await _gate.close();
    vlog(
      offload_log.info,
      "Stopped offloaded read path, offset cache {} entries",
      _offsets.size());
}

void read_handle_factory::housekeeping() {
    auto expired = _offsets.evict_expired();
    if (expired > 0) {
        vlog(offload_log.debug, "Expired {} cached offsets", expired);
    }
}

ss::future<result<ss::shared_ptr<blob_backed_read_handle>>>
read_handle_factory::open(
  cloud_io::bucket_name bucket,
  cloud_io::object_key data_key,
  cloud_io::object_key index_key,
  model::ledger_id ledger,
  ss::sstring topic) {
    auto holder = _gate.hold();
    auto res = co_await blob_backed_read_handle::open(
      _store,
      blob_backed_read_handle::open_params{
        .bucket = std::move(bucket),
        .data_key = std::move(data_key),
        .index_key = std::move(index_key),
        .ledger = ledger,
        .topic = std::move(topic),
      },
      _config,
      _version_check,
      _offsets,
      _stats);
    if (res.has_value()) {
        res.value()->hold_until_closed(std::move(holder));
    }
    co_return res;
}

} // namespace offload
