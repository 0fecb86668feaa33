/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "meganode/server/CommandReader.h"

#include <limits>

#include <folly/experimental/DynamicParser.h>
#include <folly/json.h>
#include <folly/String.h>
#include <glog/logging.h>

#include "meganode/utils/Exception.h"

namespace meganode {

namespace {

void parseTenant(folly::DynamicParser* p, Command* cmd) {
  p->required(kTenant, [&](const std::string& s) {
    cmd->tenant = TenantID::fromHex(s);
  });
}

void parseProcessID(folly::DynamicParser* p, Command* cmd) {
  p->optional(kCommandProcessID, [&](int64_t n) {
    if (n < 0 || n > std::numeric_limits<ProcessID>::max()) {
      throw std::invalid_argument("Process ID out of range");
    }
    cmd->processID = static_cast<ProcessID>(n);
  });
}

}  // anonymous namespace

Command parseCommand(folly::StringPiece line, ProcessID default_process_id) {
  folly::dynamic d = folly::parseJson(line);
  if (!d.isObject() || d.size() != 1) {
    throw MeganodeException(
      "A command must be an object with exactly one key: ", line
    );
  }

  Command cmd;
  cmd.processID = default_process_id;
  bool known = false;
  folly::DynamicParser p(folly::DynamicParser::OnError::RECORD, &d);
  p.optional(kRunCommand, [&]() {
    known = true;
    cmd.type = Command::Type::RUN;
    parseTenant(&p, &cmd);
    parseProcessID(&p, &cmd);
    p.optional(kLease, [&](int64_t n) {
      if (n < 0 || n > std::numeric_limits<LeaseID>::max()) {
        throw std::invalid_argument("Lease ID out of range");
      }
      cmd.lease = static_cast<LeaseID>(n);
    });
    p.optional(kShutdownAfterSync, [&](bool b) { cmd.shutdownAfterSync = b; });
  });
  p.optional(kEvictCommand, [&]() {
    known = true;
    cmd.type = Command::Type::EVICT;
    parseTenant(&p, &cmd);
    parseProcessID(&p, &cmd);
  });
  p.optional(kActivityCommand, [&]() {
    known = true;
    cmd.type = Command::Type::ACTIVITY;
    parseTenant(&p, &cmd);
  });

  auto errors = p.releaseErrors();
  if (!errors.empty()) {
    throw MeganodeException("Invalid command: ", folly::toJson(errors));
  }
  if (!known) {
    throw MeganodeException("Unknown command: ", line);
  }
  return cmd;
}

CommandReader::CommandReader(
    SchedulerLoop* loop,
    ProcessID default_process_id,
    HelperTaskSink helper_sink)
  : loop_(loop),
    defaultProcessID_(default_process_id),
    helperSink_(std::move(helper_sink)) {}

bool CommandReader::handleLine(folly::StringPiece line) {
  line = folly::trimWhitespace(line);
  if (line.empty()) {
    return true;
  }

  Command cmd;
  try {
    cmd = parseCommand(line, defaultProcessID_);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Skipping bad command: " << e.what();
    ++numRejected_;
    return false;
  }

  const auto name = shortTenantName(cmd.tenant);
  switch (cmd.type) {
    case Command::Type::RUN: {
      RunRequest req;
      req.tenant = cmd.tenant;
      req.lease = cmd.lease;
      req.processID = cmd.processID;
      req.shutdownAfterSync = cmd.shutdownAfterSync;
      auto lease = cmd.lease;
      track(
        folly::to<std::string>("run ", name),
        req.ready.getFuture().thenTry(
          [name, lease](folly::Try<folly::Unit>&& t) noexcept {
            if (t.hasException()) {
              LOG(WARNING) << "Run " << name << " (lease " << lease
                << ") rejected: " << t.exception().what();
            } else {
              LOG(INFO) << "Run " << name << " (lease " << lease
                << ") is ready";
            }
          }
        )
      );
      loop_->submitRun(std::move(req));
      break;
    }
    case Command::Type::EVICT: {
      EvictRequest req;
      req.tenant = cmd.tenant;
      req.processID = cmd.processID;
      track(
        folly::to<std::string>("evict ", name),
        req.stopped.getFuture().thenTry(
          [name](folly::Try<folly::Unit>&& t) noexcept {
            if (t.hasException()) {
              LOG(WARNING) << "Evict " << name << " failed: "
                << t.exception().what();
            } else {
              LOG(INFO) << "Evict " << name << " done";
            }
          }
        )
      );
      loop_->submitEvict(std::move(req));
      break;
    }
    case Command::Type::ACTIVITY:
      loop_->submitActivity(cmd.tenant);
      break;
  }
  return true;
}

void CommandReader::track(std::string name, folly::Future<folly::Unit> f) {
  if (helperSink_) {
    helperSink_(std::move(name), std::move(f));
  }
  // Otherwise, the outcome is still logged, but nobody waits for it.
}

}  // namespace meganode
