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

#include <seastar/core/semaphore.hh>
#include <seastar/core/sstring.hh>

#include <optional>

/*
 * A FIFO mutex over a named semaphore. Waiters are admitted in the order they
 * arrived, which is what makes it usable as a serial execution context.
 *
 *    mutex m{"my_mutex"};
 *    auto units = co_await m.get_units();
 */
class mutex {
public:
    using units = ss::semaphore_units<ss::named_semaphore_exception_factory>;

    explicit mutex(ss::sstring name)
      : _sem(1, ss::named_semaphore_exception_factory{std::move(name)}) {}

    template<typename Func>
    auto with(Func&& func) noexcept {
        return ss::with_semaphore(_sem, 1, std::forward<Func>(func));
    }

    ss::future<units> get_units() noexcept { return ss::get_units(_sem, 1); }

    std::optional<units> try_get_units() noexcept {
        return ss::try_get_units(_sem, 1);
    }

    void broken() noexcept { _sem.broken(); }

    bool ready() const noexcept {
        return _sem.waiters() == 0 && _sem.available_units() == 1;
    }

    size_t waiters() const noexcept { return _sem.waiters(); }

private:
    ss::named_semaphore _sem;
};
