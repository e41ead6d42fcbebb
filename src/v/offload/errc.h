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

#include <fmt/format.h>

#include <cstdint>
#include <system_error>

namespace offload {

enum class errc : int16_t {
    success = 0,
    invalid_parameter,     // Inverted or out of range entry range
    no_such_ledger,        // Index or data object is gone
    unexpected_condition,  // Entries can't be found in the expected order
    handle_closed,         // Read scheduled after close
    unsupported_operation, // Not meaningful for an offloaded ledger
    end_of_stream,         // Read past the end of the data object
    malformed_index,       // Index object can't be decoded
    version_mismatch,      // Object written with an unknown format version
    entry_out_of_range,    // Index lookup outside of [0, last_entry_id]
};

struct errc_category final : public std::error_category {
    const char* name() const noexcept final { return "offload::errc"; }

    std::string message(int c) const final {
        switch (static_cast<errc>(c)) {
        case errc::success:
            return "Success";
        case errc::invalid_parameter:
            return "Invalid entry range";
        case errc::no_such_ledger:
            return "No such ledger exists in the offload store";
        case errc::unexpected_condition:
            return "Unexpected condition while reading offloaded entries";
        case errc::handle_closed:
            return "Offloaded read handle is closed";
        case errc::unsupported_operation:
            return "Operation not supported by offloaded ledgers";
        case errc::end_of_stream:
            return "End of offloaded data object";
        case errc::malformed_index:
            return "Malformed offload index";
        case errc::version_mismatch:
            return "Unsupported offload format version";
        case errc::entry_out_of_range:
            return "Entry is outside of the ledger";
        }
        return "offload::errc::unknown";
    }
};

inline const std::error_category& error_category() noexcept {
    static errc_category e;
    return e;
}

inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace offload

namespace std {
template<>
struct is_error_code_enum<offload::errc> : true_type {};
} // namespace std
