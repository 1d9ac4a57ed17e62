/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <type_traits>
#include <vector>

#include "Method.h"
#include "Module.h"
#include "Trace.h"
#include "WorkQueue.h"

template <typename T>
struct plus_assign {
  void operator()(const T& addend, T* accumulator) const {
    *accumulator += addend;
  }
};

/**
 * A collection of methods useful for iterating over the methods of a Module.
 *
 * The name is intentionally lowercase. Think of this as a namespace with public
 * and private visibility.
 *
 * Each method is visited under a TraceContext naming it.
 */
class walk {
 public:
  // This is a "static class". Disallow construction.
  walk() = delete;
  ~walk() = delete;

  // Call walker on all types of `module`.
  //   WalkerFn should accept a `const TypeDef*`.
  template <typename WalkerFn>
  static void types(const Module& module, const WalkerFn& walker) {
    for (const auto& type : module.get_types()) {
      walker(type.get());
    }
  }

  // Call walker on all methods of `module`.
  //   WalkerFn should accept a `const Method*`.
  template <typename WalkerFn>
  static void methods(const Module& module, const WalkerFn& walker) {
    for (const auto& type : module.get_types()) {
      iterate_methods(type.get(), walker);
    }
  }

  // Call walker on all methods of `module` that have a body.
  //   WalkerFn should accept a `(const Method*, const Code&)`.
  template <typename WalkerFn>
  static void code(const Module& module, const WalkerFn& walker) {
    methods(module, [&walker](const Method* method) {
      if (method->has_code()) {
        walker(method, *method->get_code());
      }
    });
  }

 private:
  template <typename WalkerFn>
  static void iterate_methods(const TypeDef* type, const WalkerFn& walker) {
    for (const auto& method : type->get_methods()) {
      TraceContext context(method.get());
      walker(method.get());
    }
  }

 public:
  /**
   * The parallel:: methods have very similar signatures (and names) to their
   * sequential counterparts.
   * The unit of parallelization is a TypeDef, to keep the number of work items
   * proportional to the number of types rather than methods.
   */
  class parallel {
   public:
    parallel() = delete;
    ~parallel() = delete;

    // Call `walker` on all methods of `module` in parallel.
    //   WalkerFn should accept a `const Method*`.
    template <typename WalkerFn>
    static void methods(
        const Module& module,
        const WalkerFn& walker,
        size_t num_threads = dispolint_parallel::default_num_threads()) {
      workqueue_run<const TypeDef*>(
          [&walker](const TypeDef* type) {
            walk::iterate_methods(type, walker);
          },
          type_list(module), static_cast<unsigned int>(num_threads));
    }

    // Call `walker` on all methods of `module` in parallel. Then combine the
    // Accumulator objects with Reduce.
    //
    // Each thread has its own Accumulator object that the walker can modify
    // without taking a lock.
    //
    // WalkerFn should accept `(const Method*, Accumulator*)`.
    template <class Accumulator,
              class Reduce = plus_assign<Accumulator>,
              typename WalkerFn>
    static Accumulator methods(
        const Module& module,
        const WalkerFn& walker,
        size_t num_threads = dispolint_parallel::default_num_threads(),
        Accumulator init = Accumulator()) {
      num_threads = std::max<size_t>(1, num_threads);
      std::vector<Accumulator> acc_vec(num_threads, init);
      workqueue_run<const TypeDef*>(
          [&](sparta::WorkerState<const TypeDef*>* state,
              const TypeDef* type) {
            Accumulator* acc = &acc_vec[state->worker_id()];
            walk::iterate_methods(
                type, [&](const Method* method) { walker(method, acc); });
          },
          type_list(module), static_cast<unsigned int>(num_threads));

      Reduce reduce;
      for (const auto& acc : acc_vec) {
        reduce(acc, &init);
      }
      return init;
    }

   private:
    static std::vector<const TypeDef*> type_list(const Module& module) {
      std::vector<const TypeDef*> types;
      types.reserve(module.get_types().size());
      for (const auto& type : module.get_types()) {
        types.push_back(type.get());
      }
      return types;
    }
  };
};
