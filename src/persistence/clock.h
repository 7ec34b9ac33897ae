/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The prefvault project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <atomic>
#include <chrono>

namespace prefvault {
namespace persist {

// Time source for write scheduling. Injected so debounce behaviour can be
// tested without sleeping.
class Clock {
public:
  using duration   = std::chrono::steady_clock::duration;
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;
  virtual time_point now() const = 0;
};

class SteadyClock final : public Clock {
public:
  time_point now() const override { return std::chrono::steady_clock::now(); }
};

class ManualClock final : public Clock {
public:
  ManualClock() : ticks_(0) {}

  time_point now() const override {
    return time_point(duration(ticks_.load(std::memory_order_acquire)));
  }

  void advance(duration d) {
    ticks_.fetch_add(d.count(), std::memory_order_acq_rel);
  }

private:
  std::atomic<duration::rep> ticks_;
};

} // namespace persist
} // namespace prefvault
