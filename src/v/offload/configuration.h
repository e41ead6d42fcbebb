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
#include "base/units.h"

#include <seastar/core/sstring.hh>

#include <fmt/ostream.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <map>

namespace offload {

/// Read path settings shared by every offloaded read handle of a shard.
struct configuration {
    /// Size of a single ranged fetch from the data object. It's the unit in
    /// which the backed input stream buffers data.
    size_t read_ahead_size{1_MiB};
    /// Number of attempts to fetch and decode the index object on open.
    size_t index_fetch_attempts{3};
    /// Upper bound on the number of entries in the offset cache.
    size_t offset_cache_max_entries{100'000};
    /// Cached offsets expire this long after they were recorded.
    std::chrono::seconds offset_cache_ttl{600};

    using error_map_t = std::map<ss::sstring, ss::sstring>;

    /// Overrides the settings present in \p root_node.
    ///
    /// Unknown keys are fatal and raised as std::invalid_argument. Malformed
    /// values or values outside of the allowed bounds are returned in a map
    /// of setting name to error message and leave the setting untouched.
    error_map_t read_yaml(const YAML::Node& root_node);

    friend std::ostream& operator<<(std::ostream&, const configuration&);
};

} // namespace offload

template<>
struct fmt::formatter<offload::configuration> : fmt::ostream_formatter {};
