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

#include <mutex>

#include "shake/util/clock_source.h"

namespace shake {

/**
 * Mock clock source that returns a fixed time until explicitly advanced. Sleeping advances the
 * clock and returns at once.
 */
class ClockSourceMock final : public ClockSource {
public:
    explicit ClockSourceMock(Date_t start = Date_t::fromMillisSinceEpoch(1)) : _now(start) {}

    Date_t now() override {
        std::lock_guard<std::mutex> lk(_mutex);
        return _now;
    }

    void sleepFor(Milliseconds duration) override {
        advance(duration);
    }

    void advance(Milliseconds ms) {
        std::lock_guard<std::mutex> lk(_mutex);
        _now += ms;
    }

    void reset(Date_t newNow) {
        std::lock_guard<std::mutex> lk(_mutex);
        _now = newNow;
    }

private:
    std::mutex _mutex;
    Date_t _now;
};

}  // namespace shake
