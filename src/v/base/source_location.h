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
#include <fmt/ostream.h>

#include <cstdint>
#include <ostream>
#include <source_location>

namespace vlog {
namespace detail {
consteval const char* file_basename(const char* const path) {
    const char* base = path;
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    for (const char* p = path; *p != '\0'; ++p) {
        if (*p == '/' || *p == '\\') {
            base = p + 1; // NOLINT
        }
    }
    return base;
}
} // namespace detail

/// Source file basename and line of a log statement. The directory part is
/// dropped so that build-machine paths never leak into logs.
struct file_line {
    const char* filename;
    unsigned line;

    consteval static file_line
    current(const std::source_location src = std::source_location::current()) {
        return {
          .filename = detail::file_basename(src.file_name()),
          .line = src.line()};
    }

    friend std::ostream& operator<<(std::ostream& o, const file_line& fl) {
        return o << fl.filename << ":" << fl.line;
    }
};

} // namespace vlog

template<>
struct fmt::formatter<vlog::file_line> : fmt::ostream_formatter {};
