/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Licensed as a Redpanda Enterprise file under the Redpanda Community
 * License (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 * https://github.com/redpanda-data/redpanda/blob/master/licenses/rcl.md
 */

#include "cloud_io/blob_store.h"

#include <fmt/ostream.h>

#include <ostream>

namespace cloud_io {

std::ostream& operator<<(std::ostream& o, const byte_range& r) {
    fmt::print(o, "bytes={}-{}", r.first, r.last);
    return o;
}

} // namespace cloud_io
