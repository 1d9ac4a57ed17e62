/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <stdint.h>

/*
 * Method attributes as decoded from the module. Besides visibility and
 * staticness this records the special roles a method plays for its type,
 * which the metadata stores as flags or as property/event membership.
 */
// clang-format off
#define ACCESSFLAGS                             \
  AF(PUBLIC,         public,          0x1)      \
  AF(STATIC,         static,          0x2)      \
  AF(CONSTRUCTOR,    constructor,     0x4)      \
  AF(FINALIZER,      finalizer,       0x8)      \
  AF(GETTER,         getter,         0x10)      \
  AF(EVENT_ACCESSOR, event_accessor, 0x20)      \
  AF(GENERATED,      generated,      0x40)
// clang-format on

enum AccessFlags : uint32_t {
  ACC_NONE = 0,
#define AF(uc, lc, val) ACC_##uc = val,
  ACCESSFLAGS
#undef AF
};

inline AccessFlags operator&(const AccessFlags a, const AccessFlags b) {
  return (AccessFlags)((uint32_t)a & (uint32_t)b);
}

inline AccessFlags operator|(const AccessFlags a, const AccessFlags b) {
  return (AccessFlags)((uint32_t)a | (uint32_t)b);
}

inline AccessFlags& operator|=(AccessFlags& a, const AccessFlags b) {
  a = a | b;
  return a;
}

inline AccessFlags operator~(const AccessFlags a) {
  return (AccessFlags)(~(uint32_t)a);
}

#define AF(uc, lc, val)                     \
  inline bool is_##lc(AccessFlags flags) {  \
    return (flags & ACC_##uc) == ACC_##uc;  \
  }                                         \
                                            \
  template <class Member>                   \
  bool is_##lc(const Member* m) {           \
    return is_##lc(m->get_access());        \
  }
ACCESSFLAGS
#undef AF
