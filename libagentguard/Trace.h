/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <array>
#include <string>

#include "Macros.h"

#define TMS           \
  TM(CODEC)           \
  TM(CONFIG)          \
  TM(DETECT)          \
  TM(ENGINE)          \
  TM(JAR)             \
  TM(MAIN)            \
  TM(SWEEP)           \
  TM(TIME)            \
  TM(XFORM)           \
  /* End of list */

enum TraceModule : int {
#define TM(x) x,
  TMS
#undef TM
      N_TRACE_MODULES,
};

const char* trace_module_name(TraceModule module);

struct TraceLevels {
  // Applies to every module.
  long global{0};
  std::array<long, N_TRACE_MODULES> modules{};
};

/*
 * Parses the TRACE setting: a global level ("2"), per-module levels
 * ("ENGINE:3,DETECT:2") or both. Unknown modules and malformed levels are
 * reported on stderr and skipped.
 */
TraceLevels parse_trace_levels(const std::string& setting);

// The TRACE macros stay visible to the compiler in NDEBUG builds, so their
// arguments count as used, but the constexpr check drops the call.
#ifdef NDEBUG
constexpr bool traceEnabled(TraceModule, int) { return false; }
#else
bool traceEnabled(TraceModule module, int level);
#endif // NDEBUG

void trace(TraceModule module, int level, const char* fmt, ...)
    ATTR_FORMAT(3, 4);

#define TRACE(module, level, fmt, ...)               \
  do {                                               \
    if (traceEnabled(module, level)) {               \
      trace(module, level, fmt, ##__VA_ARGS__);      \
    }                                                \
  } while (0)
