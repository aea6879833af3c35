// Copyright 2025 Tenstorrent Corporation or its affiliates.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <atomic>

namespace ArmHyp
{

  /// Busy-waiting lock for short critical sections on the hypervisor
  /// control path. Usable with std::lock_guard.
  class SpinLock
  {
  public:

    SpinLock() : lock_(0)
    { }

    SpinLock(const SpinLock&) = delete;
    SpinLock& operator=(const SpinLock&) = delete;

    void lock()
    {
      while (not try_lock())
        while (lock_.load(std::memory_order_relaxed))
          ;
    }

    bool try_lock()
    {
      int expected = 0;
      return lock_.compare_exchange_strong(expected, 1, std::memory_order_acquire,
                                           std::memory_order_relaxed);
    }

    void unlock()
    { lock_.store(0, std::memory_order_release); }

  private:

    std::atomic<int> lock_;
  };

}
