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
#include <cstdint>
#include <optional>
#include "clock.h"

namespace prefvault {
namespace persist {

/**
 * Debounce state machine for durable writes.
 *
 *   Idle --deferred--> Scheduled(now+D) --deferred--> Scheduled(now+D)
 *   Scheduled --critical/cancel--> Idle
 *   Scheduled --due, begin_fire--> Firing --end_fire--> Idle
 *
 * A deferred set that arrives while Firing cannot join the write already
 * in progress (its snapshot is taken), so it is remembered and end_fire()
 * goes back to Scheduled instead of Idle.
 *
 * Not thread-safe; the owner calls it under its serialization lock.
 */
class WriteScheduler {
public:
  enum class State : uint8_t { Idle, Scheduled, Firing };

  struct Stats {
    uint64_t scheduled = 0;   // Idle -> Scheduled transitions
    uint64_t coalesced = 0;   // deadline resets of an armed timer
    uint64_t cancelled = 0;   // schedules dropped by critical writes / flush
    uint64_t fired     = 0;   // timer-driven writes started
  };

  explicit WriteScheduler(Clock::duration delay) : delay_(delay) {}

  void on_deferred(Clock::time_point now);
  void on_critical();
  void cancel() { on_critical(); }

  bool due(Clock::time_point now) const {
    return state_ == State::Scheduled && now >= deadline_;
  }

  // Scheduled -> Firing; false if nothing is scheduled
  bool begin_fire();
  void end_fire();

  State state() const { return state_; }
  Clock::time_point deadline() const { return deadline_; }
  Clock::duration delay() const { return delay_; }
  bool rearm_pending() const { return rearm_.has_value(); }
  const Stats& stats() const { return stats_; }

private:
  Clock::duration delay_;
  State state_ = State::Idle;
  Clock::time_point deadline_{};
  std::optional<Clock::time_point> rearm_;
  Stats stats_;
};

const char* scheduler_state_name(WriteScheduler::State s);

} // namespace persist
} // namespace prefvault
