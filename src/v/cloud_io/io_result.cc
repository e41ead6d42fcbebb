/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Licensed as a Redpanda Enterprise file under the Redpanda Community
 * License (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 * https://github.com/redpanda-data/redpanda/blob/master/licenses/rcl.md
 */
#include "cloud_io/io_result.h"

#include <ostream>

namespace cloud_io {

std::ostream& operator<<(std::ostream& o, const download_result& r) {
    switch (r) {
    case download_result::success:
        o << "{success}";
        break;
    case download_result::notfound:
        o << "{key_not_found}";
        break;
    case download_result::timedout:
        o << "{timed_out}";
        break;
    case download_result::failed:
        o << "{failed}";
        break;
    };
    return o;
}

std::string download_result_category::message(int c) const {
    switch (static_cast<download_result>(c)) {
    case download_result::success:
        return "Success";
    case download_result::notfound:
        return "Object key not found";
    case download_result::timedout:
        return "Object store request timed out";
    case download_result::failed:
        return "Object store request failed";
    }
    return "cloud_io::download_result::unknown";
}

const std::error_category& download_category() noexcept {
    static download_result_category e;
    return e;
}

} // namespace cloud_io
