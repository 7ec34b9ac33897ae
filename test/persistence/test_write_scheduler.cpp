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

#include <gtest/gtest.h>
#include <chrono>
#include "persistence/write_scheduler.h"

using namespace prefvault::persist;
using namespace std::chrono_literals;

class WriteSchedulerTest : public ::testing::Test {
protected:
    ManualClock clock;
    WriteScheduler sched{std::chrono::duration_cast<Clock::duration>(500ms)};
};

TEST_F(WriteSchedulerTest, StartsIdle) {
    EXPECT_EQ(sched.state(), WriteScheduler::State::Idle);
    EXPECT_FALSE(sched.due(clock.now()));
    EXPECT_FALSE(sched.begin_fire());
}

TEST_F(WriteSchedulerTest, DeferredArmsDeadline) {
    sched.on_deferred(clock.now());
    EXPECT_EQ(sched.state(), WriteScheduler::State::Scheduled);
    EXPECT_EQ(sched.deadline(), clock.now() + 500ms);

    clock.advance(499ms);
    EXPECT_FALSE(sched.due(clock.now()));
    clock.advance(1ms);
    EXPECT_TRUE(sched.due(clock.now()));
}

TEST_F(WriteSchedulerTest, DeferredResetsDeadline) {
    sched.on_deferred(clock.now());
    clock.advance(300ms);
    sched.on_deferred(clock.now());

    clock.advance(300ms);
    EXPECT_FALSE(sched.due(clock.now()));
    clock.advance(200ms);
    EXPECT_TRUE(sched.due(clock.now()));

    EXPECT_EQ(sched.stats().scheduled, 1u);
    EXPECT_EQ(sched.stats().coalesced, 1u);
}

TEST_F(WriteSchedulerTest, CriticalCancels) {
    sched.on_deferred(clock.now());
    sched.on_critical();
    EXPECT_EQ(sched.state(), WriteScheduler::State::Idle);
    EXPECT_EQ(sched.stats().cancelled, 1u);

    clock.advance(1s);
    EXPECT_FALSE(sched.due(clock.now()));

    // Nothing to cancel when idle
    sched.cancel();
    EXPECT_EQ(sched.stats().cancelled, 1u);
}

TEST_F(WriteSchedulerTest, FireCycle) {
    sched.on_deferred(clock.now());
    clock.advance(500ms);
    ASSERT_TRUE(sched.due(clock.now()));

    ASSERT_TRUE(sched.begin_fire());
    EXPECT_EQ(sched.state(), WriteScheduler::State::Firing);
    EXPECT_FALSE(sched.due(clock.now()));

    sched.end_fire();
    EXPECT_EQ(sched.state(), WriteScheduler::State::Idle);
    EXPECT_EQ(sched.stats().fired, 1u);
}

TEST_F(WriteSchedulerTest, DeferredDuringFireRearms) {
    sched.on_deferred(clock.now());
    clock.advance(500ms);
    ASSERT_TRUE(sched.begin_fire());

    clock.advance(10ms);
    sched.on_deferred(clock.now());
    EXPECT_EQ(sched.state(), WriteScheduler::State::Firing);
    EXPECT_TRUE(sched.rearm_pending());

    sched.end_fire();
    EXPECT_EQ(sched.state(), WriteScheduler::State::Scheduled);
    EXPECT_EQ(sched.deadline(), clock.now() + 500ms);
    EXPECT_FALSE(sched.rearm_pending());
}

TEST_F(WriteSchedulerTest, CriticalDuringFireDropsRearm) {
    sched.on_deferred(clock.now());
    clock.advance(500ms);
    ASSERT_TRUE(sched.begin_fire());
    sched.on_deferred(clock.now());

    sched.on_critical();
    EXPECT_FALSE(sched.rearm_pending());
    EXPECT_EQ(sched.state(), WriteScheduler::State::Firing);

    sched.end_fire();
    EXPECT_EQ(sched.state(), WriteScheduler::State::Idle);
}

TEST_F(WriteSchedulerTest, StateNames) {
    EXPECT_STREQ(scheduler_state_name(WriteScheduler::State::Idle), "Idle");
    EXPECT_STREQ(scheduler_state_name(WriteScheduler::State::Scheduled), "Scheduled");
    EXPECT_STREQ(scheduler_state_name(WriteScheduler::State::Firing), "Firing");
}
