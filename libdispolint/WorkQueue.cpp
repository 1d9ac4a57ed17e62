/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "WorkQueue.h"

#include <iostream>

#include "Debug.h"

namespace dispolint_workqueue_impl {

void queue_exception_handler(const std::exception& e) {
  // Log the stack trace where the exception was thrown; once it is rethrown
  // from run_all() that information is gone.
  print_stack_trace(std::cerr, e);
}

} // namespace dispolint_workqueue_impl
