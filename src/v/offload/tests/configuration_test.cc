/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Licensed as a Redpanda Enterprise file under the Redpanda Community
 * License (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 * https://github.com/redpanda-data/redpanda/blob/master/licenses/rcl.md
 */

#include "offload/configuration.h"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <stdexcept>

using namespace std::chrono_literals;

namespace offload {

TEST(ConfigurationTest, Defaults) {
    configuration cfg;
    EXPECT_EQ(cfg.read_ahead_size, 1_MiB);
    EXPECT_EQ(cfg.index_fetch_attempts, 3);
    EXPECT_EQ(cfg.offset_cache_max_entries, 100'000);
    EXPECT_EQ(cfg.offset_cache_ttl, 600s);
}

TEST(ConfigurationTest, ReadsOverrides) {
    configuration cfg;
    auto errors = cfg.read_yaml(YAML::Load(R"(
read_ahead_size: 65536
index_fetch_attempts: 5
offset_cache_max_entries: 1000
offset_cache_ttl_sec: 30
)"));
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(cfg.read_ahead_size, 64_KiB);
    EXPECT_EQ(cfg.index_fetch_attempts, 5);
    EXPECT_EQ(cfg.offset_cache_max_entries, 1000);
    EXPECT_EQ(cfg.offset_cache_ttl, 30s);
}

TEST(ConfigurationTest, OutOfBoundsKeepsDefault) {
    configuration cfg;
    auto errors = cfg.read_yaml(YAML::Load(R"(
read_ahead_size: 4
index_fetch_attempts: 0
offset_cache_ttl_sec: -1
)"));
    ASSERT_EQ(errors.size(), 3);
    EXPECT_EQ(
      errors["read_ahead_size"],
      "Validation error: value 4 is below the minimum 12");
    EXPECT_EQ(
      errors["offset_cache_ttl_sec"],
      "Validation error: value -1 must be positive");
    EXPECT_EQ(cfg.read_ahead_size, 1_MiB);
    EXPECT_EQ(cfg.index_fetch_attempts, 3);
    EXPECT_EQ(cfg.offset_cache_ttl, 600s);
}

TEST(ConfigurationTest, MalformedValue) {
    configuration cfg;
    auto errors = cfg.read_yaml(YAML::Load("index_fetch_attempts: many"));
    ASSERT_EQ(errors.size(), 1);
    EXPECT_TRUE(errors["index_fetch_attempts"].starts_with("Invalid value"));
    EXPECT_EQ(cfg.index_fetch_attempts, 3);
}

TEST(ConfigurationTest, UnknownPropertyThrows) {
    configuration cfg;
    EXPECT_THROW(
      cfg.read_yaml(YAML::Load("read_behind_size: 10")), std::invalid_argument);
}

} // namespace offload
