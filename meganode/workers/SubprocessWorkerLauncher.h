/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <folly/io/async/ScopedEventBaseThread.h>

#include "meganode/workers/TenantWorker.h"

namespace meganode {

/**
 * Runs each tenant's node as a child process:
 *
 *   <command...> <tenant hex> <lease> [--shutdown-after-sync]
 *
 * The child signals readiness by printing a line "ready" to stdout; other
 * stdout lines are logged.  Stderr is inherited, stdin is /dev/null.
 * Stopping sends SIGTERM.  Exiting with status 0 is a clean exit, anything
 * else is a worker failure.
 *
 * All children are polled from one EventBase thread owned by the launcher,
 * so the launcher must outlive its workers' completion.
 */
class SubprocessWorkerLauncher : public WorkerLauncher {
public:
  explicit SubprocessWorkerLauncher(
    std::vector<std::string> command,
    uint32_t poll_ms = 10
  );

  std::unique_ptr<TenantWorker> launch(
    const WorkerSpec& spec,
    WorkerReadyCob ready_cob
  ) override;

private:
  const std::vector<std::string> command_;
  const uint32_t pollMs_;
  folly::ScopedEventBaseThread evbThread_;
};

}  // namespace meganode
