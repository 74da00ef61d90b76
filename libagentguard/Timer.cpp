/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Timer.h"

#include <utility>

#include "Trace.h"

unsigned Timer::s_indent = 0;

Timer::Timer(std::string msg, bool indent)
    : m_msg(std::move(msg)),
      m_start(std::chrono::high_resolution_clock::now()),
      m_indent(indent) {
  if (indent) {
    ++s_indent;
  }
}

Timer::~Timer() {
  if (m_indent) {
    --s_indent;
  }
  auto end = std::chrono::high_resolution_clock::now();
  auto duration_s = std::chrono::duration<double>(end - m_start).count();
  TRACE(TIME, 1, "%*s%s completed in %.3lf seconds", 4 * s_indent, "",
        m_msg.c_str(), duration_s);
}
