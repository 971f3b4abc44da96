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
// LoggingObserver reports every completed transfer and the running total
// balance through glog.

#pragma once

#include <stdint.h>

#include <string>

#include "bank/Ledger.h"

namespace moneta {
namespace bank {

class LoggingObserver : public TransferObserver {
 public:
  LoggingObserver() {}
  ~LoggingObserver() override {}

  void OnTransfer(int from, int to, int64_t amount,
                  int64_t total_balance) override;

  // e.g., "Transfer from   3 to  12:   250, total balance: 100000"
  static std::string FormatTransfer(int from, int to, int64_t amount,
                                    int64_t total_balance);
};

}  // namespace bank
}  // namespace moneta

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
