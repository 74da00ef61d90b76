/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <string>

/*
 * Reports the lifetime of the enclosing scope through TRACE(TIME). Nested
 * timers are indented.
 */
struct Timer {
  explicit Timer(std::string msg, bool indent = true);
  ~Timer();

 private:
  static unsigned s_indent;
  std::string m_msg;
  std::chrono::high_resolution_clock::time_point m_start;
  bool m_indent;
};
