/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <algorithm>
#include <boost/thread/thread.hpp>
#include <exception>
#include <type_traits>
#include <utility>

#include <sparta/WorkQueue.h>

namespace dispolint_workqueue_impl {

// Prints the stack trace attached to `e`. Once run_all() rethrows the
// exception on the calling thread, the worker's stack is gone.
void queue_exception_handler(const std::exception& e);

template <typename Input, typename Fn>
struct NoStateWorkQueueHelper {
  Fn fn;
  void operator()(sparta::WorkerState<Input>*, Input a) {
    try {
      fn(std::move(a));
    } catch (const std::exception& e) {
      queue_exception_handler(e);
      throw;
    }
  }
};

template <typename Input, typename Fn>
struct WithStateWorkQueueHelper {
  Fn fn;
  void operator()(sparta::WorkerState<Input>* state, Input a) {
    try {
      fn(state, std::move(a));
    } catch (const std::exception& e) {
      queue_exception_handler(e);
      throw;
    }
  }
};

} // namespace dispolint_workqueue_impl

namespace dispolint_parallel {

inline unsigned int default_num_threads() {
  // Hardware rather than physical concurrency, to take advantage of SMT.
  return std::max(1u, boost::thread::hardware_concurrency());
}

} // namespace dispolint_parallel

/*
 * Fn is either `void(Input)` or `void(sparta::WorkerState<Input>*, Input)`.
 * The worker id of the state is in [0, num_threads) and can index
 * per-worker data that needs no locking. When an item throws, the
 * remaining items are dropped and run_all() rethrows the first exception.
 */
template <class Input,
          typename Fn,
          typename std::enable_if<sparta::Arity<Fn>::value == 1, int>::type = 0>
sparta::WorkQueue<Input,
                  dispolint_workqueue_impl::NoStateWorkQueueHelper<Input, Fn>>
workqueue_foreach(
    const Fn& fn,
    unsigned int num_threads = dispolint_parallel::default_num_threads()) {
  return sparta::WorkQueue<
      Input, dispolint_workqueue_impl::NoStateWorkQueueHelper<Input, Fn>>(
      dispolint_workqueue_impl::NoStateWorkQueueHelper<Input, Fn>{fn},
      num_threads);
}
template <class Input,
          typename Fn,
          typename std::enable_if<sparta::Arity<Fn>::value == 2, int>::type = 0>
sparta::WorkQueue<Input,
                  dispolint_workqueue_impl::WithStateWorkQueueHelper<Input, Fn>>
workqueue_foreach(
    const Fn& fn,
    unsigned int num_threads = dispolint_parallel::default_num_threads()) {
  return sparta::WorkQueue<
      Input, dispolint_workqueue_impl::WithStateWorkQueueHelper<Input, Fn>>(
      dispolint_workqueue_impl::WithStateWorkQueueHelper<Input, Fn>{fn},
      num_threads);
}

template <class Input, typename Fn, typename Items>
void workqueue_run(
    const Fn& fn,
    const Items& items,
    unsigned int num_threads = dispolint_parallel::default_num_threads()) {
  auto wq = workqueue_foreach<Input>(fn, num_threads);
  for (Input item : items) {
    wq.add_item(std::move(item));
  }
  wq.run_all();
}
