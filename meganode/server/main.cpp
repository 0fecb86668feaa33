/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <folly/File.h>
#include <folly/FileUtil.h>
#include <folly/init/Init.h>
#include <folly/io/async/EventBase.h>
#include <folly/json.h>
#include <folly/String.h>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <memory>
#include <signal.h>
#include <unistd.h>

#include "meganode/config/SchedulerConfig.h"
#include "meganode/fleet/StreamFleetManagerClient.h"
#include "meganode/processes/AsyncReadPipe.h"
#include "meganode/scheduler/SchedulerLoop.h"
#include "meganode/server/CommandReader.h"
#include "meganode/server/StopOnSignal.h"
#include "meganode/utils/Exception.h"
#include "meganode/utils/HelperTasks.h"
#include "meganode/workers/NoOpWorkerLauncher.h"
#include "meganode/workers/SubprocessWorkerLauncher.h"

DEFINE_string(
  config_file, "",
  "JSON file with the scheduler config. If empty, the defaults are used, "
  "and --process_id is required."
);
DEFINE_int32(
  process_id, -1,
  "This mega-process's ID. Overrides the config file if non-negative."
);
DEFINE_string(
  worker_command, "",
  "Space-separated command that runs one tenant's node. It gets the "
  "tenant ID, the lease ID, and maybe --shutdown-after-sync as arguments."
);
DEFINE_int32(
  worker_poll_ms, 10, "How often to check whether worker processes exited"
);
DEFINE_bool(
  dry_run, false,
  "If true, don't start any worker processes: tenants are ready at once, "
  "and stop as soon as they are asked to."
);
DEFINE_bool(
  report_activity, true,
  "If true, print activity reports for the fleet manager to stdout"
);

using namespace meganode;

namespace {

SchedulerConfig loadConfig() {
  folly::dynamic d = folly::dynamic::object;
  if (!FLAGS_config_file.empty()) {
    std::string contents;
    if (!folly::readFile(FLAGS_config_file.c_str(), contents)) {
      throw MeganodeException("Cannot read config file ", FLAGS_config_file);
    }
    d = folly::parseJson(contents);
  }
  if (FLAGS_process_id >= 0) {
    d[kProcessID] = FLAGS_process_id;
  }
  return SchedulerConfig(d);
}

std::shared_ptr<WorkerLauncher> makeLauncher() {
  if (FLAGS_dry_run) {
    return std::make_shared<NoOpWorkerLauncher>();
  }
  std::vector<std::string> cmd;
  folly::split(' ', FLAGS_worker_command, cmd, /*ignoreEmpty=*/ true);
  CHECK(!cmd.empty()) << "Pass --worker_command, or --dry_run";
  return std::make_shared<SubprocessWorkerLauncher>(
    std::move(cmd), FLAGS_worker_poll_ms
  );
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
  FLAGS_logtostderr = 1;
  folly::init(&argc, &argv);

  const auto config = loadConfig();
  LOG(INFO) << "Starting mega-process " << config.processID << " with config "
    << folly::toJson(config.toDynamic());

  HelperTasks helpers;
  NotifyOnce process_shutdown;
  folly::EventBase evb;
  {
    SchedulerLoop loop(
      config,
      makeLauncher(),
      process_shutdown,
      FLAGS_report_activity
        ? std::make_shared<StreamFleetManagerClient>()
        : nullptr,
      helpers.sink()
    );
    StopOnSignal signal_handler(&evb, {SIGINT, SIGTERM}, &loop);

    CommandReader reader(&loop, config.processID, helpers.sink());
    asyncReadLines(
      &evb,
      folly::File(STDIN_FILENO, /*owns_fd=*/ true),
      [&reader](folly::StringPiece line) { reader.handleLine(line); }
    ).thenTry([&loop](folly::Try<folly::Unit>&& t) noexcept {
      if (t.hasException()) {
        LOG(ERROR) << "Reading commands failed: " << t.exception().what();
      } else {
        LOG(INFO) << "No more commands on stdin";
      }
      // Without a command source, the tenants can only idle.
      loop.requestShutdown();
    });

    loop.drained().via(&evb).thenValue([&evb](folly::Unit) {
      LOG(INFO) << "All tenants stopped";
      evb.terminateLoopSoon();
    });
    evb.loopForever();
  }

  // Let the last outcomes and activity reports get logged.
  helpers.joinAll().get();
  LOG(INFO) << "Mega-process " << config.processID << " shut down, "
    << helpers.numFailed() << " helper tasks failed";
  return 0;
}
