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
/*
 * TransferDriver keeps a Ledger busy with randomized transfers.
 *
 * Design
 * - Each worker thread owns one source account (worker i draws from account
 *   i % AccountCount()) and repeatedly transfers a random amount in
 *   [1, max_amount] to a random account, pausing delay_ms in between.
 * - Workers run until Stop().  A worker blocked in Ledger::Transfer() waiting
 *   for funds is cancelled by interrupting its thread, so Stop() returns
 *   promptly even when every worker is starved.
 *
 * Usage
 * - Construct with a Ledger and DriverOptions (DriverOptions::FromFlags()
 *   reads the --driver_* flags), call Start(), and later Stop().  The
 *   destructor stops the workers if Stop() was not called.
 */

#pragma once

#include <gflags/gflags.h>
#include <stdint.h>

#include <atomic>
#include <mutex>

#include <boost/noncopyable.hpp>
#include <boost/thread/thread.hpp>

#include "bank/Ledger.h"

DECLARE_int32(driver_threads);
DECLARE_int64(driver_max_amount);
DECLARE_int32(driver_delay_ms);
DECLARE_uint32(driver_seed);

namespace moneta {
namespace bank {

struct DriverOptions {
  // Number of worker threads; 0 means one per account.
  int num_threads = 0;
  // Upper bound of a random transfer amount.  Must be positive.
  int64_t max_amount = 100;
  // Pause between two transfers of a worker.
  int delay_ms = 10;
  // Seed of the random engines; 0 seeds from std::random_device.
  uint32_t seed = 0;

  static DriverOptions FromFlags();
};

class TransferDriver : private boost::noncopyable {
 public:
  // "ledger" is not owned and must outlive the driver.
  TransferDriver(Ledger* ledger, const DriverOptions& options);
  ~TransferDriver();

  // Launch the worker threads.  Calling Start() again has no effect.
  void Start();

  // Stop and join all workers, cancelling those blocked for funds.
  void Stop();

  int num_threads() const { return num_threads_; }
  uint64_t completed() const { return completed_.load(); }
  uint64_t cancelled() const { return cancelled_.load(); }

 private:
  void WorkerThread(int worker_id);

  Ledger* const ledger_;
  const DriverOptions options_;
  const int num_threads_;

  // whether workers should keep issuing transfers
  std::atomic_bool running_;

  // protects started_ and workers_
  std::mutex workers_mutex_;
  bool started_;
  boost::thread_group workers_;

  std::atomic<uint64_t> completed_;
  std::atomic<uint64_t> cancelled_;
};

}  // namespace bank
}  // namespace moneta

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
