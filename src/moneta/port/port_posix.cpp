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
#include "port/port_posix.h"

#include <glog/logging.h>
#include <boost/thread/exceptions.hpp>
#include <boost/thread/locks.hpp>

namespace moneta {
namespace port {

// The Mutex is owned by the caller on entry and must still be owned on exit,
// so the unique_lock adopts it and then lets go without unlocking.
// boost::condition_variable re-acquires the mutex before it throws
// thread_interrupted.

WaitStatus CondVar::Wait() {
  boost::unique_lock<boost::mutex> lock(mu_->mu_, boost::adopt_lock);
  WaitStatus status = kWoken;
  try {
    cv_.wait(lock);
  } catch (const boost::thread_interrupted&) {
    VLOG(2) << "wait interrupted";
    status = kInterrupted;
  }
  lock.release();
  return status;
}

WaitStatus CondVar::WaitUntil(const Deadline& deadline) {
  boost::unique_lock<boost::mutex> lock(mu_->mu_, boost::adopt_lock);
  WaitStatus status = kWoken;
  try {
    if (cv_.wait_until(lock, deadline) == boost::cv_status::timeout) {
      status = kTimedOut;
    }
  } catch (const boost::thread_interrupted&) {
    VLOG(2) << "timed wait interrupted";
    status = kInterrupted;
  }
  lock.release();
  return status;
}

}  // namespace port
}  // namespace moneta

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
