/**
 *    Copyright (C) 2018-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#include "shake/util/periodic_runner.h"

#include <atomic>
#include <chrono>
#include <thread>

#include "shake/unittest/unittest.h"
#include "shake/util/concurrency/notification.h"

namespace shake {
namespace {

TEST(PeriodicRunnerTest, RunsJobRepeatedlyUntilStopped) {
    std::atomic<int> runs{0};
    Notification<bool> ranThreeTimes;

    auto anchor = PeriodicRunner::makeJob(PeriodicRunner::PeriodicJob(
        "TestJob",
        [&] {
            if (++runs == 3)
                ranThreeTimes.set(true);
        },
        Milliseconds(1)));
    ASSERT_FALSE(anchor.isRunning());
    ASSERT_EQ("TestJob", anchor.getName());

    anchor.start();
    ASSERT_TRUE(anchor.isRunning());
    ASSERT_TRUE(ranThreeTimes.get());

    anchor.stop();
    ASSERT_FALSE(anchor.isRunning());
    const int runsAtStop = runs.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_EQ(runsAtStop, runs.load());
}

TEST(PeriodicRunnerTest, JobNeverOverlapsItself) {
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    std::atomic<int> runs{0};

    auto anchor = PeriodicRunner::makeJob(PeriodicRunner::PeriodicJob(
        "SlowJob",
        [&] {
            int now = ++active;
            int seen = maxActive.load();
            while (now > seen && !maxActive.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --active;
            ++runs;
        },
        Milliseconds(0)));
    anchor.start();
    while (runs.load() < 5)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    anchor.stop();

    ASSERT_EQ(1, maxActive.load());
}

TEST(PeriodicRunnerTest, DestroyingAnchorStopsJob) {
    std::atomic<int> runs{0};
    {
        auto anchor = PeriodicRunner::makeJob(
            PeriodicRunner::PeriodicJob("ScopedJob", [&] { ++runs; }, Milliseconds(1)));
        anchor.start();
        while (runs.load() == 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    const int runsAtExit = runs.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_EQ(runsAtExit, runs.load());
}

TEST(PeriodicRunnerTest, StopBeforeStartIsHarmless) {
    auto anchor = PeriodicRunner::makeJob(
        PeriodicRunner::PeriodicJob("NeverStarted", [] {}, Milliseconds(1)));
    anchor.stop();
    ASSERT_FALSE(anchor.isRunning());

    PeriodicJobAnchor empty;
    empty.stop();
    ASSERT_FALSE(empty.isRunning());
}

}  // namespace
}  // namespace shake
