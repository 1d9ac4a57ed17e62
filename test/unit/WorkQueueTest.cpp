/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "WorkQueue.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

constexpr unsigned int NUM_INTS = 1000;

TEST(WorkQueueTest, EmptyQueue) {
  std::atomic<size_t> inv{0};
  auto wq = workqueue_foreach<std::string>(
      [&inv](const std::string& /* a */) { inv += 1; });
  wq.run_all();
  EXPECT_EQ(0u, inv.load());
}

TEST(WorkQueueTest, EmptyQueueRun) {
  std::atomic<size_t> inv{0};
  workqueue_run<std::string>(
      [&inv](const std::string& /* a */) { inv += 1; },
      std::vector<std::string>{});
  EXPECT_EQ(0u, inv.load());
}

TEST(WorkQueueTest, foreachTest) {
  std::array<int, NUM_INTS> array{};

  auto wq = workqueue_foreach<int*>([](int* a) { (*a)++; }, 4);

  for (size_t idx = 0; idx < NUM_INTS; ++idx) {
    wq.add_item(&array[idx]);
  }
  wq.run_all();

  for (const auto& e : array) {
    EXPECT_EQ(1, e);
  }
}

TEST(WorkQueueTest, RunTest) {
  std::array<int, NUM_INTS> array{};

  std::vector<int*> items;
  items.reserve(NUM_INTS);
  std::transform(array.begin(), array.end(), std::back_inserter(items),
                 [](auto& i) { return &i; });

  workqueue_run<int*>([](int* a) { (*a)++; }, items);

  for (const auto& e : array) {
    EXPECT_EQ(1, e);
  }
}

TEST(WorkQueueTest, workerIds) {
  constexpr size_t NUM_THREADS = 3;
  std::array<std::atomic<size_t>, NUM_THREADS> per_worker{};
  std::atomic<bool> out_of_range{false};

  std::vector<int> items(NUM_INTS);
  workqueue_run<int>(
      [&](sparta::WorkerState<int>* state, int /* item */) {
        if (state->worker_id() >= NUM_THREADS) {
          out_of_range = true;
          return;
        }
        per_worker[state->worker_id()] += 1;
      },
      items, NUM_THREADS);

  EXPECT_FALSE(out_of_range.load());
  size_t total = 0;
  for (const auto& n : per_worker) {
    total += n.load();
  }
  EXPECT_EQ(NUM_INTS, total);
}

TEST(WorkQueueTest, singleWorker) {
  std::atomic<size_t> inv{0};
  std::atomic<bool> other_worker{false};
  workqueue_run<int>(
      [&](sparta::WorkerState<int>* state, int /* item */) {
        if (state->worker_id() != 0) {
          other_worker = true;
        }
        inv += 1;
      },
      std::vector<int>(NUM_INTS), 1);
  EXPECT_FALSE(other_worker.load());
  EXPECT_EQ(NUM_INTS, inv.load());
}

TEST(WorkQueueTest, firstExceptionIsRethrown) {
  std::vector<int> items(100);
  for (size_t i = 0; i < items.size(); ++i) {
    items[i] = i;
  }
  EXPECT_THROW(workqueue_run<int>(
                   [](int i) {
                     if (i % 10 == 0) {
                       throw std::logic_error("item " + std::to_string(i));
                     }
                   },
                   items, 4),
               std::logic_error);
}

TEST(WorkQueueTest, exceptionTypeIsKept) {
  try {
    workqueue_run<int>(
        [](sparta::WorkerState<int>*, int) {
          throw std::out_of_range("boom");
        },
        std::vector<int>{1, 2}, 2);
    FAIL() << "no exception";
  } catch (const std::out_of_range& e) {
    EXPECT_STREQ("boom", e.what());
  }
}
