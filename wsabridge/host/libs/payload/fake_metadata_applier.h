/*
 * Copyright (C) 2025 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <map>
#include <set>
#include <string>

#include "wsabridge/host/libs/payload/file_metadata.h"

namespace wsabridge {

// Test double for MetadataApplier that remembers the last values set per path
// instead of touching the filesystem. Paths added to the failure sets make the
// corresponding call fail.
class RecordingMetadataApplier : public MetadataApplier {
 public:
  struct Applied {
    uid_t owner = 0;
    gid_t group = 0;
    mode_t mode = 0;
    std::string context;
  };

  Result<void> SetOwnership(const std::string& path, uid_t owner,
                            gid_t group) override {
    if (fail_ownership.count(path)) {
      return WB_ERR("ownership of " << path << " refused");
    }
    applied_[path].owner = owner;
    applied_[path].group = group;
    return {};
  }

  Result<void> SetMode(const std::string& path, mode_t mode) override {
    applied_[path].mode = mode;
    return {};
  }

  Result<void> SetSecurityLabel(const std::string& path,
                                const std::string& context) override {
    if (fail_label.count(path)) {
      return WB_ERR("label of " << path << " refused");
    }
    applied_[path].context = context;
    return {};
  }

  bool Has(const std::string& path) const { return applied_.count(path) > 0; }
  const Applied& At(const std::string& path) const {
    return applied_.at(path);
  }

  std::set<std::string> fail_ownership;
  std::set<std::string> fail_label;

 private:
  std::map<std::string, Applied> applied_;
};

}  // namespace wsabridge
