// Copyright (c) 2012 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.
//
// Macros for Clang's static thread-safety analysis
// (http://clang.llvm.org/docs/ThreadSafetyAnalysis.html).  They expand to
// nothing on other compilers.  Build with -Wthread-safety to get the checks.

#pragma once

#if defined(__clang__) && (!defined(SWIG))
#define MONETA_THREAD_ANNOTATION(x) __attribute__((x))
#else
#define MONETA_THREAD_ANNOTATION(x)  // no-op
#endif

#ifndef CAPABILITY
#define CAPABILITY(x) MONETA_THREAD_ANNOTATION(capability(x))
#endif

#ifndef SCOPED_CAPABILITY
#define SCOPED_CAPABILITY MONETA_THREAD_ANNOTATION(scoped_lockable)
#endif

#ifndef GUARDED_BY
#define GUARDED_BY(x) MONETA_THREAD_ANNOTATION(guarded_by(x))
#endif

#ifndef PT_GUARDED_BY
#define PT_GUARDED_BY(x) MONETA_THREAD_ANNOTATION(pt_guarded_by(x))
#endif

#ifndef REQUIRES
#define REQUIRES(...) \
  MONETA_THREAD_ANNOTATION(requires_capability(__VA_ARGS__))
#endif

#ifndef ACQUIRE
#define ACQUIRE(...) \
  MONETA_THREAD_ANNOTATION(acquire_capability(__VA_ARGS__))
#endif

#ifndef RELEASE
#define RELEASE(...) \
  MONETA_THREAD_ANNOTATION(release_capability(__VA_ARGS__))
#endif

#ifndef TRY_ACQUIRE
#define TRY_ACQUIRE(...) \
  MONETA_THREAD_ANNOTATION(try_acquire_capability(__VA_ARGS__))
#endif

#ifndef EXCLUDES
#define EXCLUDES(...) MONETA_THREAD_ANNOTATION(locks_excluded(__VA_ARGS__))
#endif

#ifndef ASSERT_CAPABILITY
#define ASSERT_CAPABILITY(x) MONETA_THREAD_ANNOTATION(assert_capability(x))
#endif

#ifndef NO_THREAD_SAFETY_ANALYSIS
#define NO_THREAD_SAFETY_ANALYSIS \
  MONETA_THREAD_ANNOTATION(no_thread_safety_analysis)
#endif

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
