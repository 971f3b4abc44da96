// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.

#pragma once

#include "port/port.h"
#include "port/thread_annotations.h"

namespace moneta {
namespace util {

// Helper class that locks a mutex on construction and unlocks the mutex when
// the destructor of the MutexLock object is invoked.
//
// Typical usage:
//
//   void MyClass::MyMethod() {
//     MutexLock l(&mu_);       // mu_ is an instance variable
//     ... some complex code, possibly with multiple return paths ...
//   }

class SCOPED_CAPABILITY MutexLock {
 public:
  explicit MutexLock(port::Mutex *mu) ACQUIRE(mu) : mu_(mu) {
    this->mu_->Lock();
  }
  ~MutexLock() RELEASE() { this->mu_->Unlock(); }

 private:
  port::Mutex *const mu_;

  DISALLOW_COPY_AND_ASSIGN(MutexLock);
};

}  // namespace util
}  // namespace moneta

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
