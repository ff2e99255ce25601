/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "WorkQueue.h"

#include <iostream>
#include <string>

#include "Debug.h"
#include "Trace.h"

namespace tighten_workqueue_impl {

void tighten_queue_exception_handler(std::exception& e) {
  // The work queue rethrows on the joining thread, where the worker's
  // backtrace is no longer around.
  TRACE(MAIN, 1, "Worker failed: %s", e.what());
  print_stack_trace(std::cerr, e);
}

} // namespace tighten_workqueue_impl
