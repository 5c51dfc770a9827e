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

#include "wsabridge/host/commands/install_bridge/pipeline.h"

#include <utility>

#include <android-base/logging.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/common/libs/utils/lock_file.h"
#include "wsabridge/host/libs/finalize/archive.h"
#include "wsabridge/host/libs/finalize/finalizer.h"
#include "wsabridge/host/libs/image/fsck.h"
#include "wsabridge/host/libs/payload/installer.h"

namespace wsabridge {

InstallPipeline::InstallPipeline(const InstallConfig& config,
                                 CommandRunner& runner,
                                 MetadataApplier& applier,
                                 PipelineOptions options)
    : config_(config),
      runner_(runner),
      applier_(applier),
      options_(std::move(options)),
      resizer_(runner, options_.allocation),
      converter_(runner),
      unsharer_(runner, resizer_),
      coordinator_(runner, converter_),
      journal_(config.JournalPath()) {
  record_.layer = config.layer();
  record_.source = config.source();
}

Result<void> InstallPipeline::Run() {
  auto lock = WB_EXPECT(LockFile::TryAcquire(config_.LockPath()));
  WB_EXPECTF(lock.has_value(), "Another install is running in \"{}\"",
             config_.input_dir());
  WB_EXPECT(DiscardInterruptedRun());
  WB_EXPECT(coordinator_.UnmountStale(config_.mount_base()));

  auto result = RunStages();
  if (!result.ok()) {
    CleanUp();
    return result;
  }
  WB_EXPECT(journal_.Remove());
  auto removed = RemovePath(config_.mount_base());
  if (!removed.ok()) {
    LOG(WARNING) << "Could not remove " << config_.mount_base() << ": "
                 << removed.error().Message();
  }
  LOG(INFO) << config_.layer() << " (" << config_.source()
            << ") installed into " << config_.input_dir();
  return {};
}

Result<void> InstallPipeline::DiscardInterruptedRun() {
  auto previous = WB_EXPECTF(journal_.Load(),
                             "Remove \"{}\" to start over", journal_.path());
  if (!previous) {
    return {};
  }
  LOG(WARNING) << "A previous " << previous->layer << " run ("
               << previous->source << ") stopped after stage "
               << previous->stage << ". Its raw images are discarded and the "
               << "install restarts from the containers.";
  RemoveRawImages();
  return {};
}

Result<void> InstallPipeline::Record(InstallStage stage) {
  record_.stage = stage;
  WB_EXPECT(journal_.Record(record_));
  return {};
}

void InstallPipeline::RecordPlan(const SizePlan& plan) {
  record_.system_target_sectors = plan.system_target.count();
  record_.vendor_target_sectors = plan.vendor_target.count();
  record_.vendor_expanded = plan.vendor_expanded;
}

Result<SizePlan> InstallPipeline::Plan() {
  auto system_size = WB_EXPECT(ApparentSize(config_.SystemImage()));
  auto vendor_size = WB_EXPECT(ApparentSize(config_.VendorImage()));
  auto plan = WB_EXPECT(PlanSizes(system_size, vendor_size, config_.layer()));
  LOG(INFO) << "Size plan: " << plan;
  return plan;
}

Result<void> InstallPipeline::RunStages() {
  WB_EXPECT(StageContainers(config_));
  WB_EXPECT(Record(InstallStage::kStarted));

  WB_EXPECT(converter_.ToRaw(config_.SystemVhdx(), config_.SystemImage()));
  WB_EXPECT(converter_.ToRaw(config_.VendorVhdx(), config_.VendorImage()));
  WB_EXPECT(Record(InstallStage::kConverted));

  auto plan = WB_EXPECT(Plan());
  RecordPlan(plan);
  // Both partitions receive payload, so both end at their planned size.
  auto system_method = WB_EXPECT(
      unsharer_.Materialize(config_.SystemImage(), plan.system_target));
  LOG(INFO) << "system: " << system_method;
  auto vendor_method = WB_EXPECT(
      unsharer_.Materialize(config_.VendorImage(), plan.vendor_target));
  LOG(INFO) << "vendor: " << vendor_method;
  WB_EXPECT(Record(InstallStage::kMaterialized));

  for (const auto& image : {config_.SystemImage(), config_.VendorImage()}) {
    WB_EXPECTF(CheckFilesystem(runner_, image),
               "Refusing to mount \"{}\"", image);
  }
  auto mounts = WB_EXPECT(coordinator_.MountPartitions(
      config_.SystemImage(), config_.VendorImage(), config_.mount_base()));
  WB_EXPECT(Record(InstallStage::kMounted));

  WB_EXPECT(ExpandVendorIfNeeded(mounts, plan));

  PayloadInstaller installer(config_.layer(), config_.source(),
                             config_.payload_dir(), applier_);
  WB_EXPECT(installer.Install({mounts.system_root, mounts.vendor_root}));
  WB_EXPECT(Record(InstallStage::kInstalled));

  Finalizer finalizer(runner_, resizer_, converter_);
  WB_EXPECT(finalizer.Finalize(mounts, config_, plan));
  WB_EXPECT(Record(InstallStage::kFinalized));

  if (config_.archive_name()) {
    auto archive = WB_EXPECT(CreateArchive(runner_, config_));
    LOG(INFO) << "Archive written to " << archive;
    WB_EXPECT(Record(InstallStage::kArchived));
  }
  return {};
}

Result<void> InstallPipeline::ExpandVendorIfNeeded(MountedPartitions& mounts,
                                                   SizePlan& plan) {
  auto available = WB_EXPECT(options_.available_bytes(mounts.vendor_root));
  LOG(INFO) << "vendor has " << HumanReadableBytes(available) << " free";
  if (!NeedsVendorExpansion(available)) {
    return {};
  }
  plan = WB_EXPECT(ExpandVendor(plan));
  LOG(WARNING) << "Less than " << HumanReadableBytes(kMinimumVendorFree.bytes())
               << " free on vendor, growing it to "
               << HumanReadableBytes(plan.vendor_target.bytes());
  RecordPlan(plan);

  const auto mount_point = mounts.vendor->mount_point();
  WB_EXPECT(mounts.vendor->Unmount());
  WB_EXPECT(resizer_.Grow(config_.VendorImage(), plan.vendor_target));
  WB_EXPECT(CheckFilesystem(runner_, config_.VendorImage()),
            "vendor is damaged after growing it");
  mounts.vendor =
      WB_EXPECT(coordinator_.MountImage(config_.VendorImage(), mount_point));
  mounts.vendor_root = ResolvePartitionRoot(mount_point, "vendor");
  WB_EXPECT(Record(InstallStage::kMounted));
  return {};
}

void InstallPipeline::RemoveRawImages() {
  for (const auto& image : {config_.SystemImage(), config_.VendorImage()}) {
    if (FileExists(image, /* follow_symlinks */ false) && !RemoveFile(image)) {
      PLOG(WARNING) << "Could not remove " << image;
    }
  }
}

void InstallPipeline::CleanUp() {
  LOG(INFO) << "Cleaning up after the failed install";
  auto unmounted = coordinator_.UnmountStale(config_.mount_base());
  if (!unmounted.ok()) {
    LOG(ERROR) << "Not removing " << config_.mount_base()
               << ", something is still mounted below it: "
               << unmounted.error().Message();
  } else {
    auto removed = RemovePath(config_.mount_base());
    if (!removed.ok()) {
      LOG(WARNING) << removed.error().Message();
    }
  }
  if (record_.stage >= InstallStage::kInstalled) {
    LOG(ERROR) << "Keeping " << config_.SystemImage() << " and "
               << config_.VendorImage()
               << " with the installed files. The next run discards them.";
    return;
  }
  RemoveRawImages();
}

}  // namespace wsabridge
