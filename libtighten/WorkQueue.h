/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/thread/thread.hpp>
#include <sparta/WorkQueue.h>

namespace tighten_workqueue_impl {

void tighten_queue_exception_handler(std::exception& e);

// Helper class so the type of Executor can be inferred
template <typename Input, typename Fn>
struct NoStateWorkQueueHelper {
  Fn fn;
  void operator()(sparta::WorkerState<Input>*, Input a) {
    try {
      fn(std::move(a));
    } catch (std::exception& e) {
      tighten_queue_exception_handler(e);
      throw;
    }
  }
};

} // namespace tighten_workqueue_impl

namespace tighten_parallel {

inline unsigned int default_num_threads() {
  // Hardware over physical concurrency, to take advantage of SMT.
  return std::max(1u, boost::thread::hardware_concurrency());
}

// A configured thread count of 0 means "use all hardware threads".
inline unsigned int num_threads_or_default(unsigned int configured) {
  return configured == 0 ? default_num_threads() : configured;
}

} // namespace tighten_parallel

template <class Input, typename Fn>
sparta::WorkQueue<Input,
                  tighten_workqueue_impl::NoStateWorkQueueHelper<Input, Fn>>
workqueue_foreach(
    const Fn& fn,
    unsigned int num_threads = tighten_parallel::default_num_threads()) {
  return sparta::WorkQueue<
      Input, tighten_workqueue_impl::NoStateWorkQueueHelper<Input, Fn>>(
      tighten_workqueue_impl::NoStateWorkQueueHelper<Input, Fn>{fn},
      num_threads,
      /* push_tasks_while_running */ false);
}

template <class Input, typename Fn, typename Items>
void workqueue_run(
    const Fn& fn,
    const Items& items,
    unsigned int num_threads = tighten_parallel::default_num_threads()) {
  auto wq = workqueue_foreach<Input>(fn, num_threads);
  for (Input item : items) {
    wq.add_item(std::move(item));
  }
  wq.run_all();
}
