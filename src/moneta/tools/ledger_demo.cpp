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
// ledger_demo runs randomized concurrent transfers against a Ledger for a
// while and checks that the total balance is conserved.
//
//   ledger_demo --accounts=10 --initial_balance=1000 --duration_ms=3000

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <stdint.h>
#include <stdio.h>

#include <memory>

#include <boost/chrono.hpp>
#include <boost/thread/thread.hpp>

#include "bank/Ledger.h"
#include "bank/LoggingObserver.h"
#include "bank/TransferDriver.h"
#include "util/common.h"

DEFINE_int32(accounts, 100, "number of accounts in the ledger");
DEFINE_int64(initial_balance, 1000, "initial balance of every account");
DEFINE_int32(duration_ms, 5000, "how long the transfer workers run");
DEFINE_bool(log_transfers, true, "log every completed transfer");

namespace {

bool ValidatePositive(const char* flagname, int32_t value) {
  if (value > 0) return true;
  fprintf(stderr, "--%s must be positive, got %d\n", flagname, value);
  return false;
}

const bool accounts_validator = google::RegisterFlagValidator(
    &FLAGS_accounts, &ValidatePositive);
const bool duration_validator = google::RegisterFlagValidator(
    &FLAGS_duration_ms, &ValidatePositive);

}  // anonymous namespace

using moneta::bank::DriverOptions;
using moneta::bank::Ledger;
using moneta::bank::LoggingObserver;
using moneta::bank::TransferDriver;

int main(int argc, char* argv[]) {
  google::SetUsageMessage("run concurrent transfers against a shared ledger");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  std::unique_ptr<LoggingObserver> observer;
  if (FLAGS_log_transfers) {
    observer.reset(new LoggingObserver());
  }
  Ledger ledger(FLAGS_accounts, FLAGS_initial_balance, observer.get());
  const int64_t expected_total = ledger.TotalBalance();
  LOG(INFO) << "ledger of " << ledger.AccountCount()
            << " accounts, total balance " << expected_total;

  TransferDriver driver(&ledger, DriverOptions::FromFlags());
  uint64_t start_us = moneta::util::NowMicros();
  driver.Start();
  boost::this_thread::sleep_for(boost::chrono::milliseconds(FLAGS_duration_ms));
  driver.Stop();
  uint64_t elapsed_us = moneta::util::NowMicros() - start_us;

  const int64_t total = ledger.TotalBalance();
  LOG(INFO) << driver.completed() << " transfers completed and "
            << driver.cancelled() << " cancelled in " << elapsed_us / 1000
            << " ms (" << driver.completed() * 1000000.0 / elapsed_us
            << " transfers/s)";
  if (total != expected_total) {
    LOG(ERROR) << "total balance changed from " << expected_total << " to "
               << total;
    return 1;
  }
  LOG(INFO) << "total balance conserved: " << total;
  return 0;
}

// vim:sw=2:sts=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
