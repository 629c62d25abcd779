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

#include "shake/util/time_support.h"

namespace shake {

/**
 * An interface for getting the current wall clock time.
 */
class ClockSource {
public:
    virtual ~ClockSource() = default;

    /**
     * Returns the current wall clock time, as defined by this source.
     */
    virtual Date_t now() = 0;

    /**
     * Blocks the calling thread until 'duration' has passed on this clock.
     */
    virtual void sleepFor(Milliseconds duration) = 0;
};

/**
 * ClockSource that reads the system wall clock.
 */
class SystemClockSource final : public ClockSource {
public:
    Date_t now() override;

    void sleepFor(Milliseconds duration) override;

    /**
     * Returns a process-lifetime instance that may be shared by all consumers.
     */
    static SystemClockSource* get();
};

}  // namespace shake
