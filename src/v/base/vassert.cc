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

#include "base/vassert.h"

#include "base/seastarx.h"

#include <seastar/util/backtrace.hh>
#include <seastar/util/log.hh>

namespace detail {

static ss::logger assert_log{"assert"};

[[noreturn]] void vassert_hook(std::string msg) {
    assert_log.error("{}", msg);
    assert_log.error("Backtrace below:\n{}", ss::current_backtrace());
    __builtin_trap();
}

} // namespace detail
