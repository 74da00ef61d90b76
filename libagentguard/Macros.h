/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#if defined(_MSC_VER) || defined(__MINGW32__) || defined(__MINGW64__)
#define IS_WINDOWS 1
#else
#define IS_WINDOWS 0
#endif

#ifndef FALLTHROUGH_INTENDED
#define FALLTHROUGH_INTENDED [[fallthrough]]
#endif

#ifdef __clang__
#define ATTR_FORMAT(STR_INDEX, PARAM_INDEX) \
  __attribute__((__format__(__printf__, STR_INDEX, PARAM_INDEX)))
#elif defined(__GNUC__)
#define ATTR_FORMAT(STR_INDEX, PARAM_INDEX) \
  __attribute__((format(printf, STR_INDEX, PARAM_INDEX)))
#else
#define ATTR_FORMAT(...)
#endif

#ifdef __GNUC__
#define PACKED(class_to_pack) class_to_pack __attribute__((packed))
#elif _MSC_VER
#define PACKED(class_to_pack) \
  __pragma(pack(push, 1)) class_to_pack __pragma(pack(pop))
#else
#error "Please define PACKED"
#endif
