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

#include <signal.h>
#include <unistd.h>

#include <cstdlib>
#include <string>

#include <android-base/logging.h>
#include <gflags/gflags.h>

#include "wsabridge/common/libs/utils/tee_logging.h"
#include "wsabridge/host/commands/install_bridge/pipeline.h"
#include "wsabridge/host/libs/config/install_config.h"
#include "wsabridge/host/libs/image/command_runner.h"
#include "wsabridge/host/libs/payload/file_metadata.h"
#include "wsabridge/result/result.h"

DEFINE_string(type, "", "Translation layer to install: libndk or libhoudini.");
DEFINE_string(source, "",
              "Payload variant. libndk: chromeos_zork. libhoudini: "
              "chromeos_volteer, hpe-14, aow-13, libhoudini_bluestacks.");
DEFINE_string(dir, "", "Directory holding system.vhdx and vendor.vhdx.");
DEFINE_string(archive, "",
              "If set, work on a copy in <dir>/<source> and pack it into "
              "<dir>/<archive>.7z.");
DEFINE_string(payload_root, "",
              "Directory containing <type>/<source>/. Defaults to the current "
              "directory.");
DEFINE_string(mount_base, "",
              "Where the images are mounted. Defaults to ./mount_temp.");
DEFINE_string(vendor_shrink_policy, "minimum",
              "Final vendor size: minimum, used_plus_buffer or keep_planned.");
DEFINE_string(log_file, "", "Also write the log to this file.");

namespace wsabridge {
namespace {

Result<void> InstallBridgeMain() {
  InstallFlags flags;
  flags.type = FLAGS_type;
  flags.source = FLAGS_source;
  flags.dir = FLAGS_dir;
  flags.archive = FLAGS_archive;
  flags.payload_root = FLAGS_payload_root;
  flags.mount_base = FLAGS_mount_base;
  flags.vendor_shrink_policy = FLAGS_vendor_shrink_policy;

  if (!FLAGS_log_file.empty()) {
    auto logger = WB_EXPECT(LogToStderrAndFiles({FLAGS_log_file}));
    android::base::SetLogger(std::move(logger));
  }

  auto config = WB_EXPECT(InstallConfig::FromFlags(flags));
  WB_EXPECT(geteuid() == 0, "Loop mounting the images needs root");
  LOG(INFO) << config;

  HostCommandRunner runner;
  HostMetadataApplier applier;
  InstallPipeline pipeline(config, runner, applier);
  WB_EXPECT(pipeline.Run());
  return {};
}

}  // namespace
}  // namespace wsabridge

int main(int argc, char** argv) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  gflags::SetUsageMessage(
      "Installs an ARM translation layer into the system and vendor VHDX "
      "images of a Windows Subsystem for Android build.");
  google::ParseCommandLineFlags(&argc, &argv, true);
  // e2fsck may exit before reading the answers written to its stdin.
  signal(SIGPIPE, SIG_IGN);

  auto result = wsabridge::InstallBridgeMain();
  if (!result.ok()) {
    LOG(ERROR) << result.error().Message();
    LOG(DEBUG) << result.error().Trace();
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
