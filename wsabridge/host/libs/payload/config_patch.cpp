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

#include "wsabridge/host/libs/payload/config_patch.h"

#include <algorithm>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include "wsabridge/common/libs/utils/files.h"

namespace wsabridge {
namespace {

std::vector<std::string> SplitLines(std::string_view contents) {
  return android::base::Split(std::string(contents), "\n");
}

std::string JoinLines(const std::vector<std::string>& lines) {
  return android::base::Join(lines, "\n");
}

// The key of a `key=value` line, empty for comments and other lines.
std::string PropertyKey(const std::string& line) {
  auto trimmed = android::base::Trim(line);
  if (trimmed.empty() || trimmed[0] == '#') {
    return "";
  }
  auto equals = trimmed.find('=');
  if (equals == std::string::npos) {
    return "";
  }
  return android::base::Trim(trimmed.substr(0, equals));
}

std::string PropertyLine(const std::string& key, const std::string& value) {
  return key + "=" + value;
}

}  // namespace

std::optional<std::string> GetProperty(std::string_view contents,
                                       const std::string& key) {
  for (const auto& line : SplitLines(contents)) {
    if (PropertyKey(line) == key) {
      return line.substr(line.find('=') + 1);
    }
  }
  return std::nullopt;
}

bool SetProperty(std::string* contents, const std::string& key,
                 const std::string& value) {
  auto lines = SplitLines(*contents);
  bool found = false;
  for (auto& line : lines) {
    if (PropertyKey(line) == key) {
      line = PropertyLine(key, value);
      found = true;
    }
  }
  if (found) {
    *contents = JoinLines(lines);
  }
  return found;
}

bool UpsertPropertiesAfter(
    std::string* contents, const std::string& anchor_key,
    const std::vector<std::pair<std::string, std::string>>& properties) {
  auto lines = SplitLines(*contents);
  auto anchor = std::find_if(lines.begin(), lines.end(), [&](auto& line) {
    return PropertyKey(line) == anchor_key;
  });
  if (anchor == lines.end()) {
    return false;
  }
  auto insert_at = static_cast<size_t>(anchor - lines.begin()) + 1;
  for (const auto& [key, value] : properties) {
    bool updated = false;
    for (auto& line : lines) {
      if (PropertyKey(line) == key) {
        line = PropertyLine(key, value);
        updated = true;
      }
    }
    if (!updated) {
      lines.insert(lines.begin() + insert_at, PropertyLine(key, value));
      ++insert_at;
    }
  }
  *contents = JoinLines(lines);
  return true;
}

size_t RemoveProperties(std::string* contents,
                        const std::vector<std::string>& keys) {
  return DeleteLines(contents, [&keys](std::string_view line) {
    auto key = PropertyKey(std::string(line));
    return !key.empty() &&
           std::find(keys.begin(), keys.end(), key) != keys.end();
  });
}

AnchorPatch InsertAfterAnchor(std::string* contents, std::string_view anchor,
                              const std::vector<std::string>& lines) {
  AnchorPatch patch;
  auto current = SplitLines(*contents);
  std::vector<std::string> patched;
  patched.reserve(current.size() + lines.size());
  for (size_t i = 0; i < current.size(); ++i) {
    patched.push_back(current[i]);
    if (current[i].find(anchor) == std::string::npos) {
      continue;
    }
    ++patch.anchors;
    bool present = i + lines.size() < current.size() &&
                   std::equal(lines.begin(), lines.end(),
                              current.begin() + i + 1);
    if (present) {
      ++patch.already_patched;
      continue;
    }
    patched.insert(patched.end(), lines.begin(), lines.end());
    ++patch.inserted;
  }
  if (patch.inserted > 0) {
    *contents = JoinLines(patched);
  }
  return patch;
}

size_t DeleteLines(std::string* contents,
                   const std::function<bool(std::string_view)>& matches) {
  auto lines = SplitLines(*contents);
  auto kept_end = std::remove_if(
      lines.begin(), lines.end(),
      [&matches](const std::string& line) { return matches(line); });
  size_t removed = static_cast<size_t>(lines.end() - kept_end);
  if (removed > 0) {
    lines.erase(kept_end, lines.end());
    *contents = JoinLines(lines);
  }
  return removed;
}

Result<ConfigFile> ConfigFile::Load(const std::string& path) {
  auto contents = WB_EXPECT(ReadFile(path));
  return ConfigFile(path, std::move(contents));
}

Result<bool> ConfigFile::Save() {
  if (!Modified()) {
    LOG(DEBUG) << path_ << " needs no changes";
    return false;
  }
  WB_EXPECTF(WriteFile(BackupPath(), original_), "Could not back up \"{}\"",
             path_);
  // Rewriting in place keeps the owner, mode and label of the original.
  WB_EXPECT(WriteFile(path_, contents_));
  LOG(DEBUG) << "Updated " << path_ << ", original kept as " << BackupPath();
  return true;
}

}  // namespace wsabridge
