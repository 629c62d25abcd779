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

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "shake/util/duration.h"

namespace shake {

class PeriodicJobAnchor;

/**
 * A PeriodicRunner runs named jobs on a fixed period.
 *
 * Each job gets a dedicated thread, so a job never overlaps with itself: the next run starts
 * 'interval' after the previous one returned. Jobs are controlled through the PeriodicJobAnchor
 * returned by makeJob().
 */
class PeriodicRunner {
public:
    using Job = std::function<void()>;

    struct PeriodicJob {
        PeriodicJob(std::string name, Job callable, Milliseconds period)
            : name(std::move(name)), job(std::move(callable)), interval(period) {}

        /**
         * Name of the job, used as the logging context of its thread.
         */
        std::string name;

        /**
         * A task to be run at regular intervals by the runner.
         */
        Job job;

        /**
         * An interval at which the job should be run.
         */
        Milliseconds interval;
    };

    /**
     * Creates a new job and returns its anchor. The job does not run until start() is called
     * on the anchor.
     */
    static PeriodicJobAnchor makeJob(PeriodicJob job);
};

/**
 * The owning handle of a periodic job. Destroying the anchor stops the job.
 */
class PeriodicJobAnchor {
public:
    class Impl;

    PeriodicJobAnchor() = default;
    explicit PeriodicJobAnchor(std::shared_ptr<Impl> impl);
    PeriodicJobAnchor(PeriodicJobAnchor&&) = default;
    PeriodicJobAnchor& operator=(PeriodicJobAnchor&&);
    PeriodicJobAnchor(const PeriodicJobAnchor&) = delete;
    PeriodicJobAnchor& operator=(const PeriodicJobAnchor&) = delete;

    ~PeriodicJobAnchor();

    /**
     * Starts running the job. May only be called once.
     */
    void start();

    /**
     * Stops the job and waits for an in-progress run to finish. Safe to call more than once.
     */
    void stop();

    /**
     * Returns true if the job was started and has not been stopped.
     */
    bool isRunning() const;

    std::string getName() const;

private:
    std::shared_ptr<Impl> _impl;
};

}  // namespace shake
