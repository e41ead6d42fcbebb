/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Licensed as a Redpanda Enterprise file under the Redpanda Community
 * License (the "License"); you may not use this file except in compliance with
 * the License. You may obtain a copy of the License at
 *
 * https://github.com/redpanda-data/redpanda/blob/master/licenses/rcl.md
 */

#include "offload/format.h"

#include "base/vlog.h"
#include "offload/errc.h"
#include "offload/logger.h"

namespace offload {

version_check make_default_version_check() {
    return [](
             const cloud_io::object_key& key,
             const cloud_io::blob_metadata& md) -> std::error_code {
        auto it = md.user_metadata.find(format::version_key);
        if (it == md.user_metadata.end()) {
            vlog(offload_log.warn, "Object {} has no format version", key);
            return errc::version_mismatch;
        }
        if (std::string_view(it->second) != format::current_version) {
            vlog(
              offload_log.warn,
              "Object {} has format version {}, expected {}",
              key,
              it->second,
              format::current_version);
            return errc::version_mismatch;
        }
        return errc::success;
    };
}

} // namespace offload
