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
#include "offload/blob_backed_read_handle.h"
#include "offload/configuration.h"
#include "offload/format.h"
#include "offload/offloader_stats.h"
#include "offload/offset_cache.h"

#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/timer.hh>

namespace offload {

/// Opens read handles of offloaded ledgers on one shard. Owns the offset
/// cache that all of them share and expires it in the background.
class read_handle_factory {
public:
    read_handle_factory(
      cloud_io::blob_store& store,
      configuration cfg,
      offloader_stats& stats,
      version_check check = make_default_version_check());

    ss::future<> start();
    /// Resolves once every handle opened by the factory has been closed.
    ss::future<> stop();

    ss::future<result<ss::shared_ptr<blob_backed_read_handle>>> open(
      cloud_io::bucket_name bucket,
      cloud_io::object_key data_key,
      cloud_io::object_key index_key,
      model::ledger_id ledger,
      ss::sstring topic);

    offset_cache& offsets() { return _offsets; }
    const configuration& config() const { return _config; }

private:
    void housekeeping();

    cloud_io::blob_store& _store;
    configuration _config;
    offloader_stats& _stats;
    version_check _version_check;
    offset_cache _offsets;
    ss::timer<ss::lowres_clock> _housekeeping_timer;
    ss::gate _gate;
};

} // namespace offload
