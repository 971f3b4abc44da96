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
#include "bank/Ledger.h"

#include <errno.h>
#include <glog/logging.h>

#include "util/mutexlock.h"

using moneta::util::MutexLock;

namespace moneta {
namespace bank {

Ledger::Ledger(int account_count, int64_t initial_balance,
               TransferObserver* observer)
    : account_count_(account_count),
      observer_(observer),
      funds_changed_(&mutex_),
      transfers_(0),
      waiters_(0) {
  CHECK_GT(account_count, 0) << "a ledger needs at least one account";
  accounts_.assign(account_count, initial_balance);
}

int Ledger::Transfer(int from, int to, int64_t amount) {
  return DoTransfer(from, to, amount, nullptr);
}

int Ledger::TransferWithin(int from, int to, int64_t amount,
                           std::chrono::milliseconds timeout) {
  const port::Deadline now = boost::chrono::steady_clock::now();
  if (timeout.count() <= 0) {
    return DoTransfer(from, to, amount, &now);
  }
  // A timeout reaching past the end of the clock is no timeout at all.
  const int64_t max_ms =
      boost::chrono::duration_cast<boost::chrono::milliseconds>(
          port::Deadline::max() - now).count();
  if (timeout.count() >= max_ms) {
    return DoTransfer(from, to, amount, nullptr);
  }
  const port::Deadline deadline =
      now + boost::chrono::milliseconds(timeout.count());
  return DoTransfer(from, to, amount, &deadline);
}

int Ledger::DoTransfer(int from, int to, int64_t amount,
                       const port::Deadline* deadline) {
  if (!IsValidAccount(from) || !IsValidAccount(to)) {
    VLOG(1) << "invalid transfer from " << from << " to " << to
            << "; accounts are [0, " << account_count_ << ")";
    return -ERANGE;
  }

  MutexLock l(&mutex_);
  while (accounts_[from] < amount) {
    VLOG(3) << "account " << from << " has " << accounts_[from]
            << ", waiting for " << amount;
    port::WaitStatus status = WaitForFunds(deadline);
    if (status == port::kInterrupted) {
      VLOG(1) << "transfer of " << amount << " from " << from << " to " << to
              << " cancelled";
      return -ECANCELED;
    }
    if (status == port::kTimedOut && accounts_[from] < amount) {
      VLOG(1) << "transfer of " << amount << " from " << from << " to " << to
              << " timed out";
      return -ETIMEDOUT;
    }
  }

  accounts_[from] -= amount;
  accounts_[to] += amount;
  ++transfers_;
  // Broadcast before the observer runs; a throwing observer must not cost
  // the waiters their wakeup.
  funds_changed_.SignalAll();
  if (observer_ != nullptr) {
    observer_->OnTransfer(from, to, amount, SumLocked());
  }
  return 0;
}

port::WaitStatus Ledger::WaitForFunds(const port::Deadline* deadline) {
  ++waiters_;
  port::WaitStatus status = deadline == nullptr
                                ? funds_changed_.Wait()
                                : funds_changed_.WaitUntil(*deadline);
  --waiters_;
  return status;
}

int64_t Ledger::SumLocked() const {
  int64_t sum = 0;
  for (int64_t balance : accounts_) {
    sum += balance;
  }
  return sum;
}

int64_t Ledger::TotalBalance() const {
  MutexLock l(&mutex_);
  return SumLocked();
}

int Ledger::Balance(int account, int64_t* balance) const {
  if (!IsValidAccount(account)) {
    return -ERANGE;
  }
  MutexLock l(&mutex_);
  *balance = accounts_[account];
  return 0;
}

void Ledger::Snapshot(std::vector<int64_t>* balances) const {
  MutexLock l(&mutex_);
  *balances = accounts_;
}

uint64_t Ledger::TransferCount() const {
  MutexLock l(&mutex_);
  return transfers_;
}

size_t Ledger::WaiterCount() const {
  MutexLock l(&mutex_);
  return waiters_;
}

}  // namespace bank
}  // namespace moneta

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
