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

#include <stdint.h>

#include <functional>
#include <optional>
#include <string>

#include "wsabridge/host/libs/config/install_config.h"
#include "wsabridge/host/libs/config/install_journal.h"
#include "wsabridge/host/libs/image/command_runner.h"
#include "wsabridge/host/libs/image/image_resizer.h"
#include "wsabridge/host/libs/image/unshare.h"
#include "wsabridge/host/libs/image/vhdx_converter.h"
#include "wsabridge/host/libs/mount/mount_session.h"
#include "wsabridge/host/libs/payload/file_metadata.h"
#include "wsabridge/host/libs/planner/space_planner.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

struct PipelineOptions {
  // Free bytes on the filesystem holding a path.
  std::function<Result<uint64_t>(const std::string&)> available_bytes =
      AvailableBytes;
  ImageResizer::Allocation allocation = ImageResizer::Allocation::kReserve;
};

// One install run over the containers named by an InstallConfig:
// convert, plan, unshare, mount, install, finalize and optionally archive.
class InstallPipeline {
 public:
  InstallPipeline(const InstallConfig& config, CommandRunner& runner,
                  MetadataApplier& applier, PipelineOptions options = {});

  // Takes the directory lock and runs every stage. On failure whatever is
  // still mounted is unmounted. The raw images are deleted unless the payload
  // already reached them. The input containers are only ever replaced by a
  // finished conversion of both.
  Result<void> Run();

 private:
  Result<void> RunStages();
  // Raw images left by a run that died are not trusted.
  Result<void> DiscardInterruptedRun();
  Result<SizePlan> Plan();
  Result<void> ExpandVendorIfNeeded(MountedPartitions& mounts, SizePlan& plan);
  Result<void> Record(InstallStage stage);
  void RecordPlan(const SizePlan& plan);
  void RemoveRawImages();
  void CleanUp();

  const InstallConfig& config_;
  CommandRunner& runner_;
  MetadataApplier& applier_;
  PipelineOptions options_;
  ImageResizer resizer_;
  VhdxConverter converter_;
  Unsharer unsharer_;
  MountCoordinator coordinator_;
  InstallJournal journal_;
  JournalRecord record_;
};

}  // namespace wsabridge
