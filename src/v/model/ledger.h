/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */

#pragma once

#include "base/seastarx.h"
#include "utils/named_type.h"

#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

#include <absl/container/btree_map.h>
#include <fmt/ostream.h>

#include <cstdint>
#include <iosfwd>
#include <vector>

namespace model {

/// Identifier assigned to a ledger by the storage layer before offload.
using ledger_id = named_type<int64_t, struct model_ledger_id_type>;

/// Position of an entry inside its ledger, contiguous from zero.
using entry_id = named_type<int64_t, struct model_entry_id_type>;

/// Static description of a closed ledger, recorded in the offload index.
struct ledger_metadata {
    entry_id last_entry_id{-1};
    uint64_t length{0};
    bool closed{false};
    int32_t ensemble_size{0};
    int32_t write_quorum_size{0};
    int32_t ack_quorum_size{0};
    int64_t ctime_ms{0};
    absl::btree_map<ss::sstring, ss::sstring> custom_metadata;

    friend bool operator==(const ledger_metadata&, const ledger_metadata&)
      = default;
    friend std::ostream& operator<<(std::ostream&, const ledger_metadata&);
};

/// One materialized entry. The payload buffer is released together with the
/// entry.
struct ledger_entry {
    ledger_id ledger;
    entry_id id;
    ss::temporary_buffer<char> payload;

    size_t length() const { return payload.size(); }

    friend std::ostream& operator<<(std::ostream&, const ledger_entry&);
};

using ledger_entries = std::vector<ledger_entry>;

} // namespace model

template<>
struct fmt::formatter<model::ledger_metadata> : fmt::ostream_formatter {};
template<>
struct fmt::formatter<model::ledger_entry> : fmt::ostream_formatter {};
