// Copyright (c) 2013-2018 Ming Chen
// Copyright (c) 2016-2016 Praveen Kumar Morampudi
// Copyright (c) 2016-2016 Harshkumar Patel
// Copyright (c) 2017-2017 Rushabh Shah
// Copyright (c) 2013-2014 Arun Olappamanna Vasudevan
// Copyright (c) 2013-2014 Kelong Wang
// Copyright (c) 2013-2018 Erez Zadok
// Copyright (c) 2013-2018 Stony Brook University
// Copyright (c) 2013-2018 The Research Foundation for SUNY
// This file is released under the GPL.
#include <gtest/gtest.h>
#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <thread>

#include <boost/thread/thread.hpp>

#include "port/port.h"
#include "util/mutexlock.h"

namespace moneta {
namespace port {
namespace test {

using moneta::util::MutexLock;

TEST(MutexTest, TryLockFailsWhileHeld) {
  Mutex mu;
  mu.Lock();
  bool acquired = true;
  std::thread t([&mu, &acquired]() { acquired = mu.TryLock(); });
  t.join();
  EXPECT_FALSE(acquired);
  mu.Unlock();
  EXPECT_TRUE(mu.TryLock());
  mu.Unlock();
}

TEST(MutexTest, MutexLockReleasesOnScopeExit) {
  Mutex mu;
  {
    MutexLock l(&mu);
    bool acquired = true;
    std::thread t([&mu, &acquired]() { acquired = mu.TryLock(); });
    t.join();
    EXPECT_FALSE(acquired);
  }
  EXPECT_TRUE(mu.TryLock());
  mu.Unlock();
}

class CondVarTest : public ::testing::Test {
 public:
  CondVarTest() : cv_(&mu_), ready_(false) {}

 protected:
  Mutex mu_;
  CondVar cv_;
  bool ready_;
};

TEST_F(CondVarTest, WaitUntilPastDeadlineTimesOut) {
  MutexLock l(&mu_);
  Deadline deadline = boost::chrono::steady_clock::now();
  EXPECT_EQ(kTimedOut, cv_.WaitUntil(deadline));
}

TEST_F(CondVarTest, SignalAllWakesEveryWaiter) {
  std::atomic<int> woken(0);
  std::thread waiters[3];
  for (auto& t : waiters) {
    t = std::thread([this, &woken]() {
      MutexLock l(&mu_);
      while (!ready_) {
        EXPECT_NE(kInterrupted, cv_.Wait());
      }
      ++woken;
    });
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  {
    MutexLock l(&mu_);
    ready_ = true;
    cv_.SignalAll();
  }
  for (auto& t : waiters) {
    t.join();
  }
  EXPECT_EQ(3, woken.load());
}

TEST_F(CondVarTest, InterruptedWaitReturnsWithMutexHeld) {
  std::atomic<int> status(-1);
  std::atomic_bool held_after_wait(false);
  boost::thread waiter([this, &status, &held_after_wait]() {
    MutexLock l(&mu_);
    status = cv_.Wait();
    bool acquired = true;
    std::thread other([this, &acquired]() { acquired = mu_.TryLock(); });
    other.join();
    held_after_wait = !acquired;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  waiter.interrupt();
  waiter.join();
  EXPECT_EQ(kInterrupted, status.load());
  EXPECT_TRUE(held_after_wait.load());
  EXPECT_TRUE(mu_.TryLock());
  mu_.Unlock();
}

TEST_F(CondVarTest, InterruptedTimedWait) {
  std::atomic<int> status(-1);
  boost::thread waiter([this, &status]() {
    MutexLock l(&mu_);
    status = cv_.WaitUntil(boost::chrono::steady_clock::now() +
                           boost::chrono::seconds(30));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  waiter.interrupt();
  waiter.join();
  EXPECT_EQ(kInterrupted, status.load());
}

}  // namespace test
}  // namespace port
}  // namespace moneta

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
