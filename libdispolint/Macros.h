/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

// Lets GCC and clang check printf-style arguments of TRACE and the
// assertion macros.
#if defined(__GNUC__) || defined(__clang__)
#define ATTR_FORMAT(STR_INDEX, PARAM_INDEX) \
  __attribute__((format(printf, STR_INDEX, PARAM_INDEX)))
#else
#define ATTR_FORMAT(...)
#endif
