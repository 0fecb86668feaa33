/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/workers/SubprocessWorkerLauncher.h"

#include <signal.h>

#include <folly/Conv.h>
#include <folly/String.h>
#include <folly/Subprocess.h>
#include <glog/logging.h>

#include "meganode/processes/AsyncReadPipe.h"
#include "meganode/processes/AsyncSubprocess.h"
#include "meganode/utils/Exception.h"

namespace meganode {

namespace {

const folly::StringPiece kReadyLine = "ready";
const std::string kShutdownAfterSyncArg = "--shutdown-after-sync";

class SubprocessWorker : public TenantWorker {
public:
  SubprocessWorker(folly::Future<folly::Unit> exited,
                   std::shared_ptr<OneSignalFlag> stop_flag)
    : exited_(std::move(exited)), stopFlag_(std::move(stop_flag)) {}

  void requestStop() noexcept override {
    stopFlag_->sendSignal();
  }

  folly::Future<folly::Unit> completion() override {
    return std::move(exited_);
  }

private:
  folly::Future<folly::Unit> exited_;
  std::shared_ptr<OneSignalFlag> stopFlag_;
};

}  // anonymous namespace

SubprocessWorkerLauncher::SubprocessWorkerLauncher(
    std::vector<std::string> command,
    uint32_t poll_ms)
  : command_(std::move(command)),
    pollMs_(poll_ms),
    evbThread_("MeganodeWorkers") {
  if (command_.empty()) {
    throw MeganodeException("Worker command must not be empty");
  }
}

std::unique_ptr<TenantWorker> SubprocessWorkerLauncher::launch(
    const WorkerSpec& spec,
    WorkerReadyCob ready_cob) {
  std::vector<std::string> cmd{command_};
  cmd.emplace_back(spec.tenant.toHex());
  cmd.emplace_back(folly::to<std::string>(spec.lease));
  if (spec.shutdownAfterSync) {
    cmd.emplace_back(kShutdownAfterSyncArg);
  }
  const auto name = folly::to<std::string>(
    shortTenantName(spec.tenant), "/", spec.invocation
  );
  LOG(INFO) << "Starting worker " << name << ": "
    << folly::join(' ', cmd);

  // Throws if the command cannot be started; the supervisor handles that.
  folly::Subprocess proc(
    cmd,
    folly::Subprocess::Options()
      .stdinFd(folly::Subprocess::DEV_NULL)
      .pipeStdout()
      .parentDeathSignal(SIGKILL)
  );

  auto stop_flag = std::make_shared<OneSignalFlag>(SIGTERM);
  folly::Promise<folly::Unit> exited;
  auto worker = std::make_unique<SubprocessWorker>(
    exited.getFuture(), stop_flag
  );

  auto* evb = evbThread_.getEventBase();
  // The pipe reader and the poller must start on the EventBase thread.
  evb->runInEventBaseThread([
    evb,
    name,
    poll_ms = pollMs_,
    proc = std::move(proc),
    stop_flag,
    ready_cob = std::move(ready_cob),
    exited = std::move(exited)
  ]() mutable {
    for (auto&& p : proc.takeOwnershipOfPipes()) {
      // Only stdout is piped.
      asyncReadLines(
        evb,
        std::move(p.pipe),
        [name, ready_cob, saw_ready = false](folly::StringPiece s) mutable {
          s.removeSuffix("\n");
          if (s.empty()) {
            return;
          }
          if (!saw_ready && s == kReadyLine) {
            saw_ready = true;
            LOG(INFO) << "Worker " << name << " is ready";
            ready_cob();
          } else {
            VLOG(1) << "Worker " << name << ": " << s;
          }
        },
        // Only log lines are long, so chunking them is fine.
        4096
      ).thenTry([name](folly::Try<folly::Unit>&& t) noexcept {
        if (t.hasException()) {
          LOG(WARNING) << "Reading stdout of worker " << name << " failed: "
            << t.exception().what();
        }
      });
    }
    asyncSubprocess(
      evb, std::move(proc), sendSignalCallback(stop_flag), poll_ms
    ).thenValue([name, exited = std::move(exited)](
        folly::ProcessReturnCode&& rc) mutable noexcept {
      if (rc.exited() && rc.exitStatus() == 0) {
        LOG(INFO) << "Worker " << name << " exited cleanly";
        exited.setValue();
      } else {
        exited.setException(MeganodeException(
          "Worker ", name, " ", rc.str()
        ));
      }
    });
  });

  return std::move(worker);
}

}  // namespace meganode
