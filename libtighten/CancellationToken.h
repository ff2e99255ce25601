/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>

/*
 * Shared by every task of one run. Usage searches poll it between sites and
 * give up once it is set; declarations whose search was cut short stay
 * unresolved.
 */
class CancellationToken {
 public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel() { m_cancelled.store(true, std::memory_order_relaxed); }

  bool is_cancelled() const {
    return m_cancelled.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<bool> m_cancelled{false};
};
