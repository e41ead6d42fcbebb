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

#include <fmt/ostream.h>

#include <cstdint>
#include <iosfwd>
#include <system_error>

namespace cloud_io {

/// Outcome of a fetch from the object store. Registered as an error code
/// enum so that transport failures travel unchanged inside std::error_code.
enum class [[nodiscard]] download_result : int32_t {
    success,
    notfound,
    timedout,
    failed,
};

std::ostream& operator<<(std::ostream& o, const download_result& r);

struct download_result_category final : public std::error_category {
    const char* name() const noexcept final { return "cloud_io::download"; }
    std::string message(int c) const final;
};

const std::error_category& download_category() noexcept;

inline std::error_code make_error_code(download_result r) noexcept {
    return {static_cast<int>(r), download_category()};
}

} // namespace cloud_io

namespace std {
template<>
struct is_error_code_enum<cloud_io::download_result> : true_type {};
} // namespace std

template<>
struct fmt::formatter<cloud_io::download_result> : fmt::ostream_formatter {};
