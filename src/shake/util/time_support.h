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

#include <compare>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "shake/util/duration.h"

namespace shake {

/**
 * Representation of a point in time, with millisecond resolution, relative to the UNIX epoch.
 */
class Date_t {
public:
    static Date_t now();

    static constexpr Date_t fromMillisSinceEpoch(long long m) {
        return Date_t(m);
    }

    static constexpr Date_t min() {
        return Date_t(0);
    }

    constexpr Date_t() = default;

    constexpr long long toMillisSinceEpoch() const {
        return _millis;
    }

    bool isFormattable() const;

    /** ISO 8601 UTC rendering, e.g. "2019-08-21T12:00:00.000Z". */
    std::string toString() const;

    template <typename Duration>
    Date_t& operator+=(Duration d) {
        _millis += std::chrono::duration_cast<Milliseconds>(d).count();
        return *this;
    }

    template <typename Duration>
    Date_t& operator-=(Duration d) {
        _millis -= std::chrono::duration_cast<Milliseconds>(d).count();
        return *this;
    }

    template <typename Duration>
    Date_t operator+(Duration d) const {
        Date_t result = *this;
        result += d;
        return result;
    }

    template <typename Duration>
    Date_t operator-(Duration d) const {
        Date_t result = *this;
        result -= d;
        return result;
    }

    Milliseconds operator-(Date_t other) const {
        return Milliseconds(_millis - other._millis);
    }

    auto operator<=>(const Date_t&) const = default;

private:
    constexpr explicit Date_t(long long m) : _millis(m) {}

    long long _millis = 0;
};

std::ostream& operator<<(std::ostream& os, Date_t date);

}  // namespace shake
