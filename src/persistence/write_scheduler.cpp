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

#include "write_scheduler.h"

namespace prefvault {
namespace persist {

void WriteScheduler::on_deferred(Clock::time_point now) {
  switch (state_) {
    case State::Idle:
      state_ = State::Scheduled;
      deadline_ = now + delay_;
      stats_.scheduled++;
      break;
    case State::Scheduled:
      deadline_ = now + delay_;
      stats_.coalesced++;
      break;
    case State::Firing:
      if (rearm_) stats_.coalesced++;
      rearm_ = now + delay_;
      break;
  }
}

void WriteScheduler::on_critical() {
  if (state_ == State::Scheduled) {
    state_ = State::Idle;
    stats_.cancelled++;
  } else if (state_ == State::Firing && rearm_) {
    // the critical write that follows covers the re-armed state
    rearm_.reset();
    stats_.cancelled++;
  }
}

bool WriteScheduler::begin_fire() {
  if (state_ != State::Scheduled) return false;
  state_ = State::Firing;
  stats_.fired++;
  return true;
}

void WriteScheduler::end_fire() {
  if (state_ != State::Firing) return;
  if (rearm_) {
    state_ = State::Scheduled;
    deadline_ = *rearm_;
    rearm_.reset();
    stats_.scheduled++;
  } else {
    state_ = State::Idle;
  }
}

const char* scheduler_state_name(WriteScheduler::State s) {
  switch (s) {
    case WriteScheduler::State::Idle:      return "Idle";
    case WriteScheduler::State::Scheduled: return "Scheduled";
    case WriteScheduler::State::Firing:    return "Firing";
  }
  return "Unknown";
}

} // namespace persist
} // namespace prefvault
