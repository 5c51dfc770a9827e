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

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wsabridge/result/result.h"

namespace wsabridge {

// Line oriented edits of build.prop and init scripts. All of them work on the
// file contents in memory; ConfigFile takes care of the backup and the write.

// The value of `key=` in a property file, ignoring comments.
std::optional<std::string> GetProperty(std::string_view contents,
                                       const std::string& key);

// Replaces the value of an existing key. Returns false if the key is absent.
bool SetProperty(std::string* contents, const std::string& key,
                 const std::string& value);

// Makes every property of `properties` present with its value. Keys that
// exist are updated in place, the rest are inserted in order right after the
// `anchor_key` line. Returns false, changing nothing, if the anchor is absent.
bool UpsertPropertiesAfter(
    std::string* contents, const std::string& anchor_key,
    const std::vector<std::pair<std::string, std::string>>& properties);

// Returns how many lines were removed.
size_t RemoveProperties(std::string* contents,
                        const std::vector<std::string>& keys);

struct AnchorPatch {
  // Lines containing the anchor.
  size_t anchors = 0;
  // Anchors that received the lines.
  size_t inserted = 0;
  // Anchors already followed by the lines.
  size_t already_patched = 0;
};

// Inserts `lines` after every line containing `anchor`, unless the lines
// following it already equal `lines`.
AnchorPatch InsertAfterAnchor(std::string* contents, std::string_view anchor,
                              const std::vector<std::string>& lines);

// Returns how many lines were removed.
size_t DeleteLines(std::string* contents,
                   const std::function<bool(std::string_view)>& matches);

// A text file loaded for editing. Save() keeps the original next to it as
// `<path>.backup` before writing the new contents.
class ConfigFile {
 public:
  static Result<ConfigFile> Load(const std::string& path);

  const std::string& path() const { return path_; }
  std::string BackupPath() const { return path_ + ".backup"; }
  std::string* contents() { return &contents_; }
  bool Modified() const { return contents_ != original_; }

  // Returns false if nothing changed, in which case nothing is written.
  Result<bool> Save();

 private:
  ConfigFile(std::string path, std::string contents)
      : path_(std::move(path)), original_(contents),
        contents_(std::move(contents)) {}

  std::string path_;
  std::string original_;
  std::string contents_;
};

}  // namespace wsabridge
