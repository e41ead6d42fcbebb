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

#include "cloud_io/blob_store.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <system_error>

/// Binary layout of offloaded ledgers. All integers are big endian.
///
/// Data object: a sequence of blocks. Every block starts with a fixed size
/// header (magic, header length, block length, first entry id, zero fill)
/// followed by records [int32 length][int64 entry id][payload] and padded up
/// to the block length with the padding word. The padding word is negative
/// when read as a record length, which marks the end of the block.
///
/// Index object: header, ledger metadata and one entry per data block that
/// maps the first entry id of the block to the block position.
namespace offload::format {

inline constexpr int32_t index_magic = static_cast<int32_t>(0xDE47DE47);
inline constexpr int32_t block_magic = static_cast<int32_t>(0xFBDBABCB);
inline constexpr int32_t block_padding = static_cast<int32_t>(0xFEDCDEAD);
inline constexpr size_t block_header_size = 128;

/// int32 length + int64 entry id
inline constexpr size_t record_header_size = 12;

/// int64 entry id + int32 part id + int64 block offset
inline constexpr size_t index_entry_size = 20;

/// magic, index length, data length, header length, entry count, metadata
/// length
inline constexpr size_t index_header_size = 4 + 4 + 8 + 8 + 4 + 4;

inline constexpr int32_t ledger_metadata_version = 1;

inline constexpr std::string_view version_key
  = "s3managedledgeroffloaderformatversion";
inline constexpr std::string_view current_version = "1";

} // namespace offload::format

namespace offload {

/// Verifies that a fetched object was written in a supported format.
/// Returns errc::version_mismatch when it was not.
using version_check = std::function<std::error_code(
  const cloud_io::object_key&, const cloud_io::blob_metadata&)>;

/// Accepts objects whose version metadata equals format::current_version.
version_check make_default_version_check();

} // namespace offload
