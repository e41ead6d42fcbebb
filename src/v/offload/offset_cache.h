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
#include "model/ledger.h"

#include <seastar/core/lowres_clock.hh>

#include <absl/container/flat_hash_map.h>
#include <boost/intrusive/list.hpp>

#include <cstdint>
#include <memory>
#include <optional>

namespace offload {

/**
 * Shard wide memoization of exact record positions in offloaded data
 * objects, keyed by (ledger, entry).
 *
 * A hit lets a read handle seek straight to a record instead of scanning
 * forward from the start of the enclosing index segment. The cache is an
 * optimization only and a miss is never an error. Entries are evicted in LRU
 * order once the cache holds more than max_entries and expire ttl after they
 * were last written. All operations are O(1) amortized and never block.
 */
template<typename Clock = ss::lowres_clock>
class basic_offset_cache {
public:
    using clock_type = Clock;

    struct config {
        size_t max_entries;
        typename Clock::duration ttl;
    };

    struct stat {
        size_t hits{0};
        size_t misses{0};
        size_t evictions{0};
        size_t expirations{0};
    };

    explicit basic_offset_cache(config cfg)
      : _config(cfg) {}

    // The intrusive lists point into the map, keep the object in place.
    basic_offset_cache(const basic_offset_cache&) = delete;
    basic_offset_cache& operator=(const basic_offset_cache&) = delete;
    basic_offset_cache(basic_offset_cache&&) = delete;
    basic_offset_cache& operator=(basic_offset_cache&&) = delete;

    ~basic_offset_cache() {
        _lru.clear();
        _by_age.clear();
    }

    /// Record the position of an entry. A later put for the same key
    /// replaces the position and restarts its ttl.
    void put(model::ledger_id ledger, model::entry_id entry, int64_t offset);

    /// Position of the entry, if it is known and hasn't expired.
    std::optional<int64_t> get(model::ledger_id ledger, model::entry_id entry);

    /// Drop every expired entry, returns how many were dropped.
    size_t evict_expired();

    size_t size() const { return _map.size(); }
    const stat& get_stat() const { return _stat; }

private:
    using hook_t = boost::intrusive::list_member_hook<
      boost::intrusive::link_mode<boost::intrusive::safe_link>>;

    struct key {
        model::ledger_id ledger;
        model::entry_id entry;

        friend bool operator==(const key&, const key&) = default;

        template<typename H>
        friend H AbslHashValue(H h, const key& k) {
            return H::combine(std::move(h), k.ledger(), k.entry());
        }
    };

    struct cached_offset {
        key k;
        int64_t offset;
        typename Clock::time_point written;
        hook_t lru_hook;
        hook_t age_hook;
    };

    using lru_list_t = boost::intrusive::list<
      cached_offset,
      boost::intrusive::
        member_hook<cached_offset, hook_t, &cached_offset::lru_hook>>;
    using age_list_t = boost::intrusive::list<
      cached_offset,
      boost::intrusive::
        member_hook<cached_offset, hook_t, &cached_offset::age_hook>>;

    bool expired(const cached_offset& e, typename Clock::time_point now) const {
        return e.written + _config.ttl <= now;
    }

    void erase(cached_offset& e) {
        auto k = e.k;
        _lru.erase(_lru.iterator_to(e));
        _by_age.erase(_by_age.iterator_to(e));
        _map.erase(k);
    }

    config _config;
    absl::flat_hash_map<key, std::unique_ptr<cached_offset>> _map;
    // most recently used at the front
    lru_list_t _lru;
    // oldest write at the front
    age_list_t _by_age;
    stat _stat;
};

template<typename Clock>
void basic_offset_cache<Clock>::put(
  model::ledger_id ledger, model::entry_id entry, int64_t offset) {
    auto now = Clock::now();
    key k{ledger, entry};
    if (auto it = _map.find(k); it != _map.end()) {
        auto& e = *it->second;
        e.offset = offset;
        e.written = now;
        _lru.erase(_lru.iterator_to(e));
        _lru.push_front(e);
        _by_age.erase(_by_age.iterator_to(e));
        _by_age.push_back(e);
        return;
    }

    auto [it, _] = _map.emplace(
      k,
      std::make_unique<cached_offset>(
        cached_offset{.k = k, .offset = offset, .written = now}));
    _lru.push_front(*it->second);
    _by_age.push_back(*it->second);

    while (_map.size() > _config.max_entries) {
        erase(_lru.back());
        ++_stat.evictions;
    }
}

template<typename Clock>
std::optional<int64_t>
basic_offset_cache<Clock>::get(model::ledger_id ledger, model::entry_id entry) {
    auto it = _map.find(key{ledger, entry});
    if (it == _map.end()) {
        ++_stat.misses;
        return std::nullopt;
    }
    auto& e = *it->second;
    if (expired(e, Clock::now())) {
        erase(e);
        ++_stat.expirations;
        ++_stat.misses;
        return std::nullopt;
    }
    _lru.erase(_lru.iterator_to(e));
    _lru.push_front(e);
    ++_stat.hits;
    return e.offset;
}

template<typename Clock>
size_t basic_offset_cache<Clock>::evict_expired() {
    auto now = Clock::now();
    size_t n = 0;
    while (!_by_age.empty() && expired(_by_age.front(), now)) {
        erase(_by_age.front());
        ++n;
    }
    _stat.expirations += n;
    return n;
}

using offset_cache = basic_offset_cache<>;

} // namespace offload
