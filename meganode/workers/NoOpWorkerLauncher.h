/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "meganode/workers/TenantWorker.h"

namespace meganode {

/**
 * Launches workers that do nothing: each becomes ready at once, and exits
 * as soon as it is asked to stop.  Workers launched with
 * shutdownAfterSync exit right after becoming ready, since there is
 * nothing to sync.  Good for dry runs of the scheduler.
 */
class NoOpWorkerLauncher : public WorkerLauncher {
public:
  std::unique_ptr<TenantWorker> launch(
    const WorkerSpec& spec,
    WorkerReadyCob ready_cob
  ) override;
};

}  // namespace meganode
