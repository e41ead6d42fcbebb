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

#include "offload/format.h"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace offload {

namespace {

using setter_fn
  = std::function<std::optional<ss::sstring>(const YAML::Node&)>;

template<typename T>
setter_fn bounded_setter(T& field, T min) {
    return [&field, min](const YAML::Node& node) -> std::optional<ss::sstring> {
        auto v = node.as<T>();
        if (v < min) {
            return fmt::format("value {} is below the minimum {}", v, min);
        }
        field = v;
        return std::nullopt;
    };
}

} // namespace

configuration::error_map_t
configuration::read_yaml(const YAML::Node& root_node) {
    std::map<std::string_view, setter_fn> setters{
      {"read_ahead_size",
       bounded_setter<size_t>(read_ahead_size, format::record_header_size)},
      {"index_fetch_attempts", bounded_setter<size_t>(index_fetch_attempts, 1)},
      {"offset_cache_max_entries",
       bounded_setter<size_t>(offset_cache_max_entries, 1)},
      {"offset_cache_ttl_sec",
       [this](const YAML::Node& node) -> std::optional<ss::sstring> {
           auto v = node.as<int64_t>();
           if (v <= 0) {
               return fmt::format("value {} must be positive", v);
           }
           offset_cache_ttl = std::chrono::seconds(v);
           return std::nullopt;
       }},
    };

    error_map_t errors;
    for (const auto& node : root_node) {
        auto key = node.first.as<std::string>();
        ss::sstring name(key.data(), key.size());
        auto it = setters.find(std::string_view(key));
        if (it == setters.end()) {
            throw std::invalid_argument(
              fmt::format("Unknown property {}", name));
        }
        try {
            if (auto err = it->second(node.second); err.has_value()) {
                errors[name] = fmt::format("Validation error: {}", *err);
            }
        } catch (const YAML::InvalidNode& e) {
            errors[name] = fmt::format("Invalid syntax: {}", e.what());
        } catch (const YAML::ParserException& e) {
            errors[name] = fmt::format("Invalid syntax: {}", e.what());
        } catch (const YAML::BadConversion& e) {
            errors[name] = fmt::format("Invalid value: {}", e.what());
        }
    }
    return errors;
}

std::ostream& operator<<(std::ostream& o, const configuration& cfg) {
    fmt::print(
      o,
      "{{read_ahead_size: {}, index_fetch_attempts: {}, "
      "offset_cache_max_entries: {}, offset_cache_ttl: {}}}",
      cfg.read_ahead_size,
      cfg.index_fetch_attempts,
      cfg.offset_cache_max_entries,
      cfg.offset_cache_ttl);
    return o;
}

} // namespace offload
