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
#include "bank/LoggingObserver.h"

#include <glog/logging.h>
#include <boost/thread/thread.hpp>

#include <iomanip>
#include <sstream>

namespace moneta {
namespace bank {

std::string LoggingObserver::FormatTransfer(int from, int to, int64_t amount,
                                            int64_t total_balance) {
  std::ostringstream oss;
  oss << "Transfer from " << std::setw(3) << from << " to " << std::setw(3)
      << to << ": " << std::setw(5) << amount
      << ", total balance: " << total_balance;
  return oss.str();
}

void LoggingObserver::OnTransfer(int from, int to, int64_t amount,
                                 int64_t total_balance) {
  LOG(INFO) << "[thread " << boost::this_thread::get_id() << "] "
            << FormatTransfer(from, to, amount, total_balance);
}

}  // namespace bank
}  // namespace moneta

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
