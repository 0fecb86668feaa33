/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>

#include <folly/Range.h>

#include "meganode/scheduler/SchedulerLoop.h"
#include "meganode/utils/HelperTasks.h"

namespace meganode {

// JSON keys of the stdin command protocol.
constexpr folly::StringPiece kRunCommand = "run";
constexpr folly::StringPiece kEvictCommand = "evict";
constexpr folly::StringPiece kActivityCommand = "activity";
constexpr folly::StringPiece kTenant = "tenant";
constexpr folly::StringPiece kLease = "lease";
constexpr folly::StringPiece kCommandProcessID = "process_id";
constexpr folly::StringPiece kShutdownAfterSync = "shutdown_after_sync";

struct Command {
  enum class Type { RUN, EVICT, ACTIVITY };

  Type type{Type::ACTIVITY};
  TenantID tenant;
  LeaseID lease{0};
  ProcessID processID{0};
  bool shutdownAfterSync{false};
};

/**
 * Parses one command line, e.g.
 *
 *   {"run": {"tenant": "<64 hex chars>", "lease": 5,
 *            "process_id": 7, "shutdown_after_sync": false}}
 *   {"evict": {"tenant": "<hex>", "process_id": 7}}
 *   {"activity": {"tenant": "<hex>"}}
 *
 * "tenant" is required; "process_id" defaults to `default_process_id`.
 * Throws MeganodeException listing every problem with the line.
 */
Command parseCommand(folly::StringPiece line, ProcessID default_process_id);

/**
 * Feeds newline-delimited JSON commands into a SchedulerLoop, and logs
 * each request's outcome once the scheduler resolves it.  The outcome
 * futures go to the helper-task sink, so shutdown can wait for them.
 *
 * Bad lines are logged and skipped.
 */
class CommandReader {
public:
  CommandReader(
    SchedulerLoop* loop,
    ProcessID default_process_id,
    HelperTaskSink helper_sink = nullptr
  );

  // Returns false if the line was not a valid command.  Blank lines are
  // valid no-ops.
  bool handleLine(folly::StringPiece line);

  size_t numRejected() const { return numRejected_; }

private:
  void track(std::string name, folly::Future<folly::Unit> f);

  SchedulerLoop* loop_;
  const ProcessID defaultProcessID_;
  HelperTaskSink helperSink_;
  std::atomic<size_t> numRejected_{0};
};

}  // namespace meganode
