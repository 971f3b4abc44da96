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
// Mutex and condition variable on top of boost.thread.
//
// A CondVar is bound to one Mutex for its whole life, in the style of
// pthread_cond_t.  Waiting on it is a boost.thread interruption point: a
// thread blocked in Wait() or WaitUntil() can be cancelled with
// boost::thread::interrupt(), in which case the wait returns kInterrupted with
// the mutex held again.

#pragma once

#include <boost/chrono.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

#include "port/thread_annotations.h"
#include "util/common.h"

namespace moneta {
namespace port {

typedef boost::chrono::steady_clock::time_point Deadline;

enum WaitStatus {
  kWoken = 0,        // notified, or woken spuriously
  kTimedOut = 1,
  kInterrupted = 2,
};

class CondVar;

class CAPABILITY("mutex") Mutex {
 public:
  Mutex() {}

  void Lock() ACQUIRE() { mu_.lock(); }
  void Unlock() RELEASE() { mu_.unlock(); }

  // Returns true if the mutex was acquired.
  bool TryLock() TRY_ACQUIRE(true) { return mu_.try_lock(); }

 private:
  friend class CondVar;
  boost::mutex mu_;

  DISALLOW_COPY_AND_ASSIGN(Mutex);
};

class CondVar {
 public:
  explicit CondVar(Mutex* mu) : mu_(mu) {}

  // Atomically releases the mutex and blocks until notified.  The mutex is
  // held again when this returns, whatever the status.
  // REQUIRES: the calling thread holds the mutex.  The analysis cannot see
  // through mu_, so callers wrap waits in a helper annotated
  // REQUIRES(<their mutex>) (see Ledger::WaitForFunds).
  WaitStatus Wait();

  // Like Wait(), but gives up once "deadline" has passed.
  WaitStatus WaitUntil(const Deadline& deadline);

  void Signal() { cv_.notify_one(); }
  void SignalAll() { cv_.notify_all(); }

 private:
  boost::condition_variable cv_;
  Mutex* const mu_;

  DISALLOW_COPY_AND_ASSIGN(CondVar);
};

}  // namespace port
}  // namespace moneta

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
