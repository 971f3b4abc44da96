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
#include "bank/TransferDriver.h"

#include <errno.h>
#include <glog/logging.h>
#include <string.h>

#include <random>

#include <boost/chrono.hpp>
#include <boost/thread/exceptions.hpp>

DEFINE_int32(driver_threads, 0,
             "number of transfer worker threads; 0 means one per account");
DEFINE_int64(driver_max_amount, 100,
             "upper bound of the amount of a random transfer");
DEFINE_int32(driver_delay_ms, 10,
             "pause of a worker between two transfers, in milliseconds");
DEFINE_uint32(driver_seed, 0,
              "seed of the workers' random engines; 0 picks a random seed");

namespace {

bool ValidateMaxAmount(const char* flagname, int64_t value) {
  if (value > 0) return true;
  LOG(ERROR) << "--" << flagname << " must be positive, got " << value;
  return false;
}

bool ValidateNonNegative(const char* flagname, int32_t value) {
  if (value >= 0) return true;
  LOG(ERROR) << "--" << flagname << " must not be negative, got " << value;
  return false;
}

const bool max_amount_validator = google::RegisterFlagValidator(
    &FLAGS_driver_max_amount, &ValidateMaxAmount);
const bool threads_validator = google::RegisterFlagValidator(
    &FLAGS_driver_threads, &ValidateNonNegative);
const bool delay_validator = google::RegisterFlagValidator(
    &FLAGS_driver_delay_ms, &ValidateNonNegative);

}  // anonymous namespace

namespace moneta {
namespace bank {

DriverOptions DriverOptions::FromFlags() {
  DriverOptions options;
  options.num_threads = FLAGS_driver_threads;
  options.max_amount = FLAGS_driver_max_amount;
  options.delay_ms = FLAGS_driver_delay_ms;
  options.seed = FLAGS_driver_seed;
  return options;
}

TransferDriver::TransferDriver(Ledger* ledger, const DriverOptions& options)
    : ledger_(ledger),
      options_(options),
      num_threads_(options.num_threads > 0 ? options.num_threads
                                           : ledger->AccountCount()),
      running_(false),
      started_(false),
      completed_(0),
      cancelled_(0) {
  CHECK_GT(options_.max_amount, 0);
  CHECK_GE(options_.delay_ms, 0);
}

TransferDriver::~TransferDriver() {
  Stop();
}

void TransferDriver::Start() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  if (started_) return;
  started_ = true;
  running_.store(true);
  for (int i = 0; i < num_threads_; ++i) {
    workers_.create_thread([this, i]() { WorkerThread(i); });
  }
  LOG(INFO) << "started " << num_threads_ << " transfer workers";
}

void TransferDriver::Stop() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  if (!started_ || !running_.load()) return;
  running_.store(false);
  workers_.interrupt_all();
  workers_.join_all();
  LOG(INFO) << "stopped transfer workers: " << completed_.load()
            << " transfers completed, " << cancelled_.load() << " cancelled";
}

void TransferDriver::WorkerThread(int worker_id) {
  const int naccounts = ledger_->AccountCount();
  const int from = worker_id % naccounts;
  std::mt19937 rand_eng(options_.seed == 0 ? std::random_device()()
                                           : options_.seed + worker_id);
  std::uniform_int_distribution<int> to_dist(0, naccounts - 1);
  std::uniform_int_distribution<int64_t> amount_dist(1, options_.max_amount);

  try {
    while (running_.load()) {
      int to = to_dist(rand_eng);
      int64_t amount = amount_dist(rand_eng);
      int ret = ledger_->Transfer(from, to, amount);
      if (ret == -ECANCELED) {
        ++cancelled_;
        break;
      } else if (ret < 0) {
        LOG(ERROR) << "worker " << worker_id << ": transfer of " << amount
                   << " from " << from << " to " << to
                   << " failed: " << strerror(-ret);
        continue;
      }
      ++completed_;
      if (options_.delay_ms > 0) {
        boost::this_thread::sleep_for(
            boost::chrono::milliseconds(options_.delay_ms));
      }
    }
  } catch (const boost::thread_interrupted&) {
    VLOG(1) << "worker " << worker_id << " interrupted while pausing";
  }
  VLOG(1) << "worker " << worker_id << " exits";
}

}  // namespace bank
}  // namespace moneta

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
