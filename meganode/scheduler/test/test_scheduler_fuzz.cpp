/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <random>
#include <unordered_set>

#include <folly/Conv.h>
#include <folly/Random.h>

#include "meganode/scheduler/test/utils.h"

using namespace meganode;
using State = TenantScheduler::State;

// Drives the scheduler with random commands and random worker behavior,
// checking its bookkeeping after every step.  Reproduce a failure with
// MEGANODE_FUZZ_SEED=<seed from the log>, and run longer with
// MEGANODE_FUZZ_ITERS.

namespace {

uint64_t envOr(const char* name, uint64_t dflt) {
  const char* v = getenv(name);
  return v ? folly::to<uint64_t>(v) : dflt;
}

class SchedulerFuzzer {
public:
  explicit SchedulerFuzzer(uint64_t seed)
    : rng_(seed),
      now_(sec(folly::Random::rand32(1000000, rng_))),
      // 20 slots under the hard limit, 18 under the soft limit.
      h_(
        smallConfig(folly::dynamic::object
          (kTotalMemoryBytes, 2100)
          (kEvictionWatchdogSec, 5)),
        now_
      ) {}

  void step() {
    double p = folly::Random::randDouble01(rng_);
    if (p < 0.6) {
      // 10% of run requests go to the wrong process.
      bool misrouted = folly::Random::oneIn(10, rng_);
      RunRequest req;
      req.tenant = sampleTenant();
      req.lease = folly::Random::rand32(rng_);
      req.processID = kTestProcess;
      if (misrouted) {
        req.processID += 1 + folly::Random::rand32(5, rng_);
      }
      req.shutdownAfterSync = folly::Random::oneIn(4, rng_);
      notifiers_.emplace_back(req.ready.getFuture());
      h_.sched.handleRunRequest(std::move(req), now_);
    } else if (p < 0.8) {
      EvictRequest req;
      req.tenant = pickTracked().value_or(sampleTenant());
      req.processID = kTestProcess;
      notifiers_.emplace_back(req.stopped.getFuture());
      h_.sched.handleEvictRequest(std::move(req), now_);
    } else {
      h_.sched.handleActivity(sampleTenant(), now_);
    }
    EXPECT_EQ(0, h_.sched.assertInvariants());

    actOnWorkers();
    h_.sched.processWorkerEvents(now_);
    EXPECT_EQ(0, h_.sched.assertInvariants());

    if (folly::Random::oneIn(2, rng_)) {
      now_ += Timestamp(folly::Random::rand32(1001, rng_));
    }
    h_.sched.evictAnyInactiveWorkers(now_);
    h_.sched.checkStuckEvictions(now_);
    if (h_.sched.shutdownProcessIfInactive(now_)) {
      ++numShutdowns_;
    }
    EXPECT_EQ(0, h_.sched.assertInvariants());
    EXPECT_LE(numShutdowns_, 1);
    EXPECT_LE(h_.sched.budget().numWorkers(), h_.sched.budget().maxWorkers());
  }

  // Stops everything, lets every worker exit, and checks that nobody is
  // left waiting.
  void drain() {
    h_.sched.beginShutdown(now_);
    EXPECT_EQ(0, h_.sched.numInState(State::STARTING));
    EXPECT_EQ(0, h_.sched.numInState(State::RUNNING));
    for (auto& w : h_.launcher->all()) {
      if (!w->finished) {
        MockWorkerLauncher::finish(*w, folly::Random::oneIn(3, rng_));
      }
    }
    h_.sched.processWorkerEvents(now_);
    EXPECT_TRUE(h_.sched.isDrained());
    EXPECT_EQ(0, h_.sched.budget().numWorkers());
    EXPECT_TRUE(h_.sched.recency().empty());
    for (auto& f : notifiers_) {
      EXPECT_TRUE(f.isReady());
    }
    EXPECT_EQ(0, h_.sched.assertInvariants());
    LOG(INFO) << "Fuzzer finished: " << h_.sched.summary();
  }

private:
  TenantID sampleTenant() {
    return tenant(folly::Random::rand32(256, rng_));
  }

  folly::Optional<TenantID> pickTracked() {
    const auto& r = h_.sched.recency();
    if (r.empty() || folly::Random::oneIn(10, rng_)) {
      return folly::none;
    }
    auto it = r.begin();
    std::advance(it, folly::Random::rand32(r.size(), rng_));
    return it->tenant;
  }

  // Workers become ready, honor stop requests, or crash, at random.
  void actOnWorkers() {
    for (auto& w : h_.launcher->all()) {
      if (w->finished) {
        continue;
      }
      const auto invocation = w->spec.invocation;
      if (!readied_.count(invocation) && folly::Random::oneIn(3, rng_)) {
        readied_.insert(invocation);
        w->readyCob();
      }
      if (w->numStopRequests > 0 && folly::Random::oneIn(2, rng_)) {
        MockWorkerLauncher::finish(*w, folly::Random::oneIn(5, rng_));
      } else if (folly::Random::oneIn(100, rng_)) {
        MockWorkerLauncher::finish(*w, folly::Random::oneIn(2, rng_));
      }
    }
  }

  std::mt19937_64 rng_;
  Timestamp now_;
  SchedulerHarness h_;
  std::vector<folly::Future<folly::Unit>> notifiers_;
  std::unordered_set<InvocationID> readied_;
  int numShutdowns_{0};
};

}  // anonymous namespace

TEST(TestSchedulerFuzz, RandomCommands) {
  const uint64_t seed = envOr("MEGANODE_FUZZ_SEED", folly::Random::rand64());
  const uint64_t iters = envOr("MEGANODE_FUZZ_ITERS", 2000);
  LOG(INFO) << "Fuzzing the scheduler: MEGANODE_FUZZ_SEED=" << seed
    << " MEGANODE_FUZZ_ITERS=" << iters;
  SCOPED_TRACE(folly::to<std::string>("seed ", seed));

  SchedulerFuzzer fuzzer(seed);
  for (uint64_t i = 0; i < iters; ++i) {
    fuzzer.step();
    if (HasFailure()) {
      FAIL() << "Failed at iteration " << i;
    }
  }
  fuzzer.drain();
}
