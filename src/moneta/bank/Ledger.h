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
// A Ledger is a fixed set of numbered accounts shared by many threads.  Funds
// move between accounts with Transfer(), which blocks while the source
// account cannot cover the amount and resumes once some other transfer has
// changed the balances.
//
// All balances are guarded by a single mutex.  A transfer checks the source
// balance, debits and credits under that mutex, so every transfer is atomic
// with respect to every other one and the sum of all balances never changes.
// A transfer that finds insufficient funds waits on a condition variable bound
// to the same mutex; every completed transfer wakes all waiters, which then
// re-check their own source account.
//
// Errors are reported as negative errno values:
//   -ERANGE      an account index is outside [0, AccountCount())
//   -ECANCELED   the thread was interrupted while waiting for funds
//   -ETIMEDOUT   TransferWithin() ran out of time
// Insufficient funds is never an error.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <chrono>
#include <vector>

#include "port/port.h"
#include "port/thread_annotations.h"
#include "util/common.h"

namespace moneta {
namespace bank {

// Receives every completed transfer.
class TransferObserver {
 public:
  virtual ~TransferObserver() {}

  // Called right after "amount" moved from account "from" to account "to".
  // "total_balance" is the sum of all balances at that moment.
  //
  // REQUIRES: must not call back into the Ledger; the Ledger's mutex is held
  // during the call.
  virtual void OnTransfer(int from, int to, int64_t amount,
                          int64_t total_balance) = 0;
};

// Ledger is thread-safe.
class Ledger {
 public:
  // REQUIRES: account_count > 0.  "observer", if not null, is not owned and
  // must outlive the Ledger.
  Ledger(int account_count, int64_t initial_balance,
         TransferObserver* observer = nullptr);

  /**
   * Move "amount" from account "from" to account "to".
   *
   * Blocks until the balance of "from" is at least "amount".  A zero or
   * negative amount never blocks.  "from" may equal "to".
   *
   * Cancel a blocked transfer by interrupting its boost::thread.
   *
   * @return 0 on success, -ERANGE for an invalid account, or -ECANCELED if
   * the wait was interrupted.  Balances are untouched on failure.
   */
  int Transfer(int from, int to, int64_t amount) EXCLUDES(mutex_);

  /**
   * Same as Transfer() but waits for funds at most "timeout".
   *
   * @return 0, -ERANGE, -ECANCELED, or -ETIMEDOUT if the balance of "from"
   * was still below "amount" when the timeout expired.
   */
  int TransferWithin(int from, int to, int64_t amount,
                     std::chrono::milliseconds timeout) EXCLUDES(mutex_);

  // Sum of all balances.
  int64_t TotalBalance() const EXCLUDES(mutex_);

  int AccountCount() const { return account_count_; }

  // Store the balance of "account" in *balance.
  // Return 0 on success, or -ERANGE if the account does not exist.
  int Balance(int account, int64_t* balance) const EXCLUDES(mutex_);

  // Consistent copy of all balances, ordered by account index.
  void Snapshot(std::vector<int64_t>* balances) const EXCLUDES(mutex_);

  // Number of transfers completed so far.
  uint64_t TransferCount() const EXCLUDES(mutex_);

  // Number of transfers currently blocked waiting for funds.
  size_t WaiterCount() const EXCLUDES(mutex_);

 private:
  bool IsValidAccount(int account) const {
    return account >= 0 && account < account_count_;
  }

  // A null "deadline" waits forever.
  int DoTransfer(int from, int to, int64_t amount,
                 const port::Deadline* deadline) EXCLUDES(mutex_);

  // Park on funds_changed_ until woken, interrupted, or past "deadline".
  // funds_changed_ is bound to mutex_.
  port::WaitStatus WaitForFunds(const port::Deadline* deadline)
      REQUIRES(mutex_);

  int64_t SumLocked() const REQUIRES(mutex_);

  const int account_count_;
  TransferObserver* const observer_;

  mutable port::Mutex mutex_;
  // Signalled after every completed transfer.
  port::CondVar funds_changed_;

  std::vector<int64_t> accounts_ GUARDED_BY(mutex_);
  uint64_t transfers_ GUARDED_BY(mutex_);
  size_t waiters_ GUARDED_BY(mutex_);

  DISALLOW_COPY_AND_ASSIGN(Ledger);
};

}  // namespace bank
}  // namespace moneta

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
