// Copyright (c) 2011 The LevelDB Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file. See the AUTHORS file for names of contributors.
// Portability layer: the synchronization primitives the rest of moneta is
// built on.

#pragma once

#include "port/port_posix.h"

// vim:sw=2:ts=2:tw=80:expandtab:cinoptions=>2,(0\:0:
