/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <memory>

#include <folly/futures/Future.h>

#include "meganode/types/Ids.h"
#include "meganode/types/TenantID.h"

namespace meganode {

/**
 * Everything a launcher needs to start one tenant's node.
 */
struct WorkerSpec {
  TenantID tenant;
  LeaseID lease{0};
  InvocationID invocation{0};
  // Opaque to the scheduler: the worker decides what "sync" means.
  bool shutdownAfterSync{false};
};

// Must be thread-safe, called at most once per worker.
using WorkerReadyCob = std::function<void()>;

/**
 * The scheduler's handle to one running tenant worker.  The scheduler never
 * looks inside: it can only ask the worker to stop, and learn when it
 * exited.
 */
class TenantWorker {
public:
  virtual ~TenantWorker() {}

  /**
   * Asks the worker to wind down cooperatively.  Does not wait for it to
   * exit.  Thread-safe and idempotent; may be called again if the worker
   * seems stuck.
   */
  virtual void requestStop() noexcept = 0;

  /**
   * Called exactly once, right after launch.  The future is fulfilled when
   * the worker has released its resources.  An exception means the worker
   * failed, but it is gone either way.
   */
  virtual folly::Future<folly::Unit> completion() = 0;
};

/**
 * Starts tenant workers.  This is the seam between the scheduler and the
 * node implementation.
 *
 * Contract for each launched worker: exactly once, either call `ready_cob`
 * and keep serving until asked to stop, or terminate.  A worker must honor
 * requestStop() by terminating in bounded time.
 *
 * launch() may throw if the worker cannot be started at all; the
 * supervisor then treats it as a worker that failed immediately.
 */
class WorkerLauncher {
public:
  virtual ~WorkerLauncher() {}

  virtual std::unique_ptr<TenantWorker> launch(
    const WorkerSpec& spec,
    WorkerReadyCob ready_cob
  ) = 0;
};

}  // namespace meganode
