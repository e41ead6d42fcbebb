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

#include "model/ledger.h"

#include <fmt/ostream.h>

#include <ostream>

namespace model {

std::ostream& operator<<(std::ostream& o, const ledger_metadata& m) {
    fmt::print(
      o,
      "{{last_entry_id: {}, length: {}, closed: {}, ensemble: {}, "
      "write_quorum: {}, ack_quorum: {}, ctime_ms: {}, custom_keys: {}}}",
      m.last_entry_id,
      m.length,
      m.closed,
      m.ensemble_size,
      m.write_quorum_size,
      m.ack_quorum_size,
      m.ctime_ms,
      m.custom_metadata.size());
    return o;
}

std::ostream& operator<<(std::ostream& o, const ledger_entry& e) {
    fmt::print(
      o, "{{ledger: {}, entry: {}, length: {}}}", e.ledger, e.id, e.length());
    return o;
}

} // namespace model
