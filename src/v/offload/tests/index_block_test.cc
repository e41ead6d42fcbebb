/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Licensed as a Redpanda Enterprise file under the Redpanda Community
 * License (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 * https://github.com/redpanda-data/redpanda/blob/master/licenses/rcl.md
 */

#include "cloud_io/tests/memory_blob_store.h"
#include "offload/errc.h"
#include "offload/format.h"
#include "offload/index_block.h"
#include "offload/tests/ledger_object_builder.h"
#include "test_utils/test.h"

#include <seastar/core/byteorder.hh>

#include <gtest/gtest.h>

#include <limits>

namespace offload {

namespace {

tests::ledger_object_builder make_builder() {
    tests::ledger_object_builder b(256);
    // 32 byte records, four per block
    b.append_many(10, 20);
    return b;
}

} // namespace

TEST(IndexBlockTest, DecodesMetadataAndEntries) {
    auto builder = make_builder();
    builder.metadata().custom_metadata.emplace("application", "pulsar");
    auto res = index_block::decode(builder.index_object());
    ASSERT_TRUE(res.has_value()) << res.error().message();
    const auto& ix = res.value();

    EXPECT_EQ(ix.last_entry_id(), model::entry_id(9));
    EXPECT_EQ(ix.metadata().length, 200);
    EXPECT_TRUE(ix.metadata().closed);
    EXPECT_EQ(ix.metadata().ensemble_size, 3);
    EXPECT_EQ(ix.metadata().ack_quorum_size, 2);
    EXPECT_EQ(ix.metadata().custom_metadata.at("application"), "pulsar");
    EXPECT_EQ(ix.data_object_length(), builder.data_object_length());
    EXPECT_EQ(ix.data_header_length(), format::block_header_size);
    EXPECT_EQ(ix.size(), 3);
}

TEST(IndexBlockTest, LookupReturnsEnclosingBlock) {
    auto builder = make_builder();
    auto ix = index_block::decode(builder.index_object()).value();
    auto expected = builder.index_entries();

    EXPECT_EQ(ix.lookup(model::entry_id(0)).value(), expected[0]);
    EXPECT_EQ(ix.lookup(model::entry_id(3)).value(), expected[0]);
    EXPECT_EQ(ix.lookup(model::entry_id(4)).value(), expected[1]);
    EXPECT_EQ(ix.lookup(model::entry_id(9)).value(), expected[2]);
    EXPECT_EQ(ix.lookup(model::entry_id(5)).value().data_offset, 256 + 128);

    int64_t prev = 0;
    for (int64_t i = 0; i <= 9; ++i) {
        auto offset = ix.lookup(model::entry_id(i)).value().data_offset;
        EXPECT_GE(offset, prev);
        prev = offset;
    }
}

TEST(IndexBlockTest, LookupOutOfRange) {
    auto ix = index_block::decode(make_builder().index_object()).value();
    auto below = ix.lookup(model::entry_id(-1));
    ASSERT_TRUE(below.has_error());
    EXPECT_EQ(below.error(), errc::entry_out_of_range);
    auto past = ix.lookup(model::entry_id(10));
    ASSERT_TRUE(past.has_error());
    EXPECT_EQ(past.error(), errc::entry_out_of_range);
}

TEST(IndexBlockTest, SameSegment) {
    auto ix = index_block::decode(make_builder().index_object()).value();
    EXPECT_TRUE(ix.same_segment(model::entry_id(0), model::entry_id(3)));
    EXPECT_FALSE(ix.same_segment(model::entry_id(3), model::entry_id(4)));
    EXPECT_TRUE(ix.same_segment(model::entry_id(8), model::entry_id(9)));
    EXPECT_FALSE(ix.same_segment(model::entry_id(9), model::entry_id(10)));
}

TEST(IndexBlockTest, EmptyLedger) {
    tests::ledger_object_builder builder;
    auto res = index_block::decode(builder.index_object());
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().last_entry_id(), model::entry_id(-1));
    EXPECT_EQ(res.value().size(), 0);
    EXPECT_TRUE(res.value().lookup(model::entry_id(0)).has_error());
}

TEST(IndexBlockTest, RejectsBadMagic) {
    auto buf = make_builder().index_object();
    ss::write_be<int32_t>(buf.get_write(), format::block_magic);
    auto res = index_block::decode(std::move(buf));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), errc::malformed_index);
}

TEST(IndexBlockTest, RejectsTruncatedObject) {
    auto buf = make_builder().index_object();
    buf.trim(buf.size() - 7);
    auto res = index_block::decode(std::move(buf));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), errc::malformed_index);
}

TEST(IndexBlockTest, RejectsUnknownMetadataVersion) {
    auto buf = make_builder().index_object();
    ss::write_be<int32_t>(
      buf.get_write() + format::index_header_size, 2); // NOLINT
    auto res = index_block::decode(std::move(buf));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), errc::malformed_index);
}

namespace {

// Start of the index entry table, after the header and the metadata.
char* entry_table(ss::temporary_buffer<char>& buf) {
    auto md_len = ss::read_be<int32_t>(buf.get() + 28); // NOLINT
    return buf.get_write() + format::index_header_size + md_len; // NOLINT
}

} // namespace

TEST(IndexBlockTest, RejectsNonZeroFirstEntry) {
    auto buf = make_builder().index_object();
    ss::write_be<int64_t>(entry_table(buf), 1);
    auto res = index_block::decode(std::move(buf));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), errc::malformed_index);
}

TEST(IndexBlockTest, RejectsUnorderedEntries) {
    auto buf = make_builder().index_object();
    // Second entry repeats the first entry id
    ss::write_be<int64_t>(
      entry_table(buf) + format::index_entry_size, 0); // NOLINT
    auto res = index_block::decode(std::move(buf));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), errc::malformed_index);
}

TEST(IndexBlockTest, RejectsOverflowingBlockOffset) {
    auto buf = make_builder().index_object();
    // Block offset of the last entry, the data offset would overflow
    ss::write_be<int64_t>(
      entry_table(buf) + 2 * format::index_entry_size + 12, // NOLINT
      std::numeric_limits<int64_t>::max());
    auto res = index_block::decode(std::move(buf));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), errc::malformed_index);
}

TEST(IndexBlockTest, RejectsOffsetsPastDataObject) {
    auto buf = make_builder().index_object();
    // Shrink the data object length below the last block
    ss::write_be<int64_t>(buf.get_write() + 8, 300); // NOLINT
    auto res = index_block::decode(std::move(buf));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), errc::malformed_index);
}

TEST_CORO(IndexBlockTest, DecodesFromStream) {
    cloud_io::memory_blob_store store;
    cloud_io::bucket_name bucket{"bucket"};
    cloud_io::object_key key{"ledger-1-index"};
    auto builder = make_builder();
    store.set_chunk_size(7);
    store.put(bucket, key, builder.index_object());

    auto blob = co_await store.get_blob(bucket, key);
    ASSERT_TRUE_CORO(blob.has_value());
    auto res = co_await index_block::decode(blob.value().payload);
    co_await blob.value().payload.close();
    ASSERT_RESULT_OK_CORO(res);
    ASSERT_EQ_CORO(res.value().last_entry_id(), model::entry_id(9));
    ASSERT_EQ_CORO(res.value().size(), 3);
}

TEST_CORO(IndexBlockTest, TruncatedStreamIsMalformed) {
    cloud_io::memory_blob_store store;
    cloud_io::bucket_name bucket{"bucket"};
    cloud_io::object_key key{"ledger-1-index"};
    auto buf = make_builder().index_object();
    buf.trim(40);
    store.put(bucket, key, std::move(buf));

    auto blob = co_await store.get_blob(bucket, key);
    ASSERT_TRUE_CORO(blob.has_value());
    auto res = co_await index_block::decode(blob.value().payload);
    co_await blob.value().payload.close();
    ASSERT_RESULT_ERROR_CORO(res, errc::malformed_index);
}

TEST_CORO(IndexBlockTest, BrokenStreamThrows) {
    cloud_io::memory_blob_store store;
    cloud_io::bucket_name bucket{"bucket"};
    cloud_io::object_key key{"ledger-1-index"};
    store.put(bucket, key, make_builder().index_object());
    store.inject_stream_failure(key, 10);

    auto blob = co_await store.get_blob(bucket, key);
    ASSERT_TRUE_CORO(blob.has_value());
    bool thrown = false;
    try {
        co_await index_block::decode(blob.value().payload);
    } catch (const std::system_error& e) {
        thrown = e.code() == cloud_io::download_result::failed;
    }
    co_await blob.value().payload.close();
    ASSERT_TRUE_CORO(thrown);
}

} // namespace offload
