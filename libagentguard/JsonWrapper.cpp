/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "JsonWrapper.h"

#include <algorithm>
#include <json/value.h>
#include <json/writer.h>

#include "AgentGuardException.h"

namespace {

std::string describe(const Json::Value& val) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, val);
}

std::string as_string(const char* name, const Json::Value& val) {
  assert_or_throw(val.isString(), AgentGuardError::INVALID_CONFIG,
                  "Cannot convert JSON value to string: " + describe(val),
                  {{"key", name}});
  return val.asString();
}

template <typename Fn>
void for_each_string(const char* name, const Json::Value& arr, const Fn& fn) {
  assert_or_throw(arr.isArray(), AgentGuardError::INVALID_CONFIG,
                  "Cannot convert JSON value to array: " + describe(arr),
                  {{"key", name}});
  for (auto const& str : arr) {
    fn(as_string(name, str));
  }
}

} // namespace

JsonWrapper::JsonWrapper() : JsonWrapper(Json::Value(Json::objectValue)) {}
JsonWrapper::JsonWrapper(const Json::Value& config)
    : m_config(new Json::Value(config)) {
  assert_or_throw(m_config->isObject() || m_config->isNull(),
                  AgentGuardError::INVALID_CONFIG,
                  "Expected a JSON object: " + describe(config));
}

JsonWrapper::~JsonWrapper() {}

JsonWrapper::JsonWrapper(JsonWrapper&& other) noexcept
    : m_config(std::move(other.m_config)) {}
JsonWrapper& JsonWrapper::operator=(JsonWrapper&& rhs) noexcept {
  m_config = std::move(rhs.m_config);
  return *this;
}

void JsonWrapper::get(const char* name, int64_t dflt, int64_t& param) const {
  auto val = m_config->get(name, (Json::Int64)dflt);
  assert_or_throw(val.isIntegral(), AgentGuardError::INVALID_CONFIG,
                  "Cannot convert JSON value to int: " + describe(val),
                  {{"key", name}});
  param = val.asInt64();
}

void JsonWrapper::get(const char* name,
                      const std::string& dflt,
                      std::string& param) const {
  param = as_string(name, m_config->get(name, dflt));
}

std::string JsonWrapper::get(const char* name, const std::string& dflt) const {
  return as_string(name, m_config->get(name, dflt));
}

void JsonWrapper::get(const char* name, bool dflt, bool& param) const {
  auto val = m_config->get(name, dflt);

  if (val.isBool()) {
    param = val.asBool();
    return;
  } else if (val.isInt()) {
    auto valInt = val.asInt();
    if (valInt == 0 || valInt == 1) {
      param = (val.asInt() != 0);
      return;
    }
  } else if (val.isString()) {
    auto str = val.asString();
    std::transform(str.begin(), str.end(), str.begin(),
                   [](auto c) { return ::tolower(c); });
    if (str == "0" || str == "false" || str == "off" || str == "no") {
      param = false;
      return;
    } else if (str == "1" || str == "true" || str == "on" || str == "yes") {
      param = true;
      return;
    }
  }
  throw_typed(AgentGuardError::INVALID_CONFIG,
              "Cannot convert JSON value to bool: " + describe(val),
              {{"key", name}});
}

bool JsonWrapper::get(const char* name, bool dflt) const {
  bool res;
  get(name, dflt, res);
  return res;
}

void JsonWrapper::get(const char* name,
                      const std::vector<std::string>& dflt,
                      std::vector<std::string>& param) const {
  const auto& it = (*m_config)[name];
  // NOLINTNEXTLINE(readability-container-size-empty)
  if (it == Json::nullValue) {
    param = dflt;
  } else {
    param.clear();
    for_each_string(name, it,
                    [&](std::string str) { param.emplace_back(std::move(str)); });
  }
}

void JsonWrapper::get(const char* name,
                      const std::vector<std::string>& dflt,
                      std::unordered_set<std::string>& param) const {
  const auto& it = (*m_config)[name];
  param.clear();
  // NOLINTNEXTLINE(readability-container-size-empty)
  if (it == Json::nullValue) {
    param.insert(dflt.begin(), dflt.end());
  } else {
    for_each_string(name, it,
                    [&](std::string str) { param.emplace(std::move(str)); });
  }
}

JsonWrapper JsonWrapper::get_object(const char* name) const {
  const auto& it = (*m_config)[name];
  // NOLINTNEXTLINE(readability-container-size-empty)
  if (it == Json::nullValue) {
    return JsonWrapper();
  }
  assert_or_throw(it.isObject(), AgentGuardError::INVALID_CONFIG,
                  "Cannot convert JSON value to object: " + describe(it),
                  {{"key", name}});
  return JsonWrapper(it);
}

const Json::Value& JsonWrapper::operator[](const char* name) const {
  return (*m_config)[name];
}

bool JsonWrapper::contains(const char* name) const {
  return m_config->isObject() && m_config->isMember(name);
}
