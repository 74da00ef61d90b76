/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Trace.h"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <vector>

namespace {

constexpr std::array<const char*, N_TRACE_MODULES> kModuleNames = {{
#define TM(x) #x,
    TMS
#undef TM
}};

bool parse_level(const std::string& text, long& level) {
  char* end = nullptr;
  level = strtol(text.c_str(), &end, 10);
  return !text.empty() && *end == '\0' && level >= 0;
}

// TRACEFILE is a path, or the number of a descriptor opened by a wrapper.
FILE* open_trace_file(const char* where) {
  if (where == nullptr) {
    return stderr;
  }
  long fd;
  FILE* file = parse_level(where, fd) ? fdopen(static_cast<int>(fd), "w")
                                      : fopen(where, "w");
  if (file == nullptr) {
    fprintf(stderr, "Cannot open TRACEFILE %s, tracing to stderr\n", where);
    return stderr;
  }
  return file;
}

class Tracer {
 public:
  Tracer() {
    const char* setting = getenv("TRACE");
    if (setting != nullptr) {
      m_levels = parse_trace_levels(setting);
      m_file = open_trace_file(getenv("TRACEFILE"));
    }
    m_show_timestamps = getenv("SHOW_TIMESTAMPS") != nullptr;
    m_show_module = getenv("SHOW_TRACEMODULE") != nullptr;
  }

  ~Tracer() {
    if (m_file != stderr) {
      fclose(m_file);
    }
  }

  bool enabled(TraceModule module, int level) const {
    return level <= m_levels.global || level <= m_levels.modules[module];
  }

  void print(TraceModule module, int level, const char* fmt, va_list ap) {
    std::lock_guard<std::mutex> guard(m_mutex);
    if (m_show_timestamps) {
      auto now = std::time(nullptr);
      struct tm local;
      localtime_r(&now, &local);
      std::array<char, 40> stamp;
      std::strftime(stamp.data(), stamp.size(), "%c", &local);
      fprintf(m_file, "[%s] ", stamp.data());
    }
    if (m_show_module) {
      fprintf(m_file, "[%s:%d] ", trace_module_name(module), level);
    }
    vfprintf(m_file, fmt, ap);
    fputc('\n', m_file);
    fflush(m_file);
  }

 private:
  TraceLevels m_levels;
  FILE* m_file{stderr};
  bool m_show_timestamps{false};
  bool m_show_module{false};
  std::mutex m_mutex;
};

Tracer& get_tracer() {
  static Tracer tracer;
  return tracer;
}

} // namespace

const char* trace_module_name(TraceModule module) {
  return kModuleNames[module];
}

TraceLevels parse_trace_levels(const std::string& setting) {
  TraceLevels levels;
  std::vector<std::string> items;
  boost::split(items, setting, boost::is_any_of(", "),
               boost::token_compress_on);
  for (const auto& item : items) {
    if (item.empty()) {
      continue;
    }
    auto colon = item.find(':');
    long level;
    if (colon == std::string::npos) {
      if (parse_level(item, level)) {
        levels.global = level;
      } else {
        fprintf(stderr, "Bad trace level %s, ignoring\n", item.c_str());
      }
      continue;
    }
    auto name = item.substr(0, colon);
    if (!parse_level(item.substr(colon + 1), level)) {
      fprintf(stderr, "Bad trace level %s, ignoring\n", item.c_str());
      continue;
    }
    auto it = std::find(kModuleNames.begin(), kModuleNames.end(), name);
    if (it == kModuleNames.end()) {
      fprintf(stderr, "Unknown trace module %s, ignoring\n", name.c_str());
      continue;
    }
    levels.modules[it - kModuleNames.begin()] = level;
  }
  return levels;
}

#ifndef NDEBUG
bool traceEnabled(TraceModule module, int level) {
  return get_tracer().enabled(module, level);
}
#endif

void trace(TraceModule module, int level, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  get_tracer().print(module, level, fmt, ap);
  va_end(ap);
}
