//
// Copyright (C) 2022 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "wsabridge/common/libs/utils/json.h"

#include <memory>
#include <string_view>

#include "wsabridge/common/libs/utils/files.h"

namespace wsabridge {

Result<Json::Value> ParseJson(std::string_view input) {
  Json::Value root;
  JSONCPP_STRING err;
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  auto begin = input.data();
  auto end = begin + input.length();
  WB_EXPECT(reader->parse(begin, end, &root, &err), err);
  return root;
}

Result<Json::Value> LoadFromFile(const std::string& path_to_file) {
  std::string contents = WB_EXPECT(ReadFile(path_to_file));
  return WB_EXPECTF(ParseJson(contents), "Could not parse \"{}\" as json",
                    path_to_file);
}

Result<void> SaveToFile(const Json::Value& root,
                        const std::string& path_to_file) {
  Json::StreamWriterBuilder factory;
  factory["indentation"] = "  ";
  // Written next to the destination and renamed so readers never see a
  // partial document.
  auto tmp_path = path_to_file + ".tmp";
  WB_EXPECT(WriteFile(tmp_path, Json::writeString(factory, root)));
  WB_EXPECT(RenameFile(tmp_path, path_to_file));
  return {};
}

}  // namespace wsabridge
