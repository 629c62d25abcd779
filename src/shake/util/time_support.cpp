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

#include "shake/util/time_support.h"

#include <chrono>
#include <ctime>
#include <ostream>

#include <fmt/format.h>

namespace shake {

Date_t Date_t::now() {
    return fromMillisSinceEpoch(std::chrono::duration_cast<Milliseconds>(
                                    std::chrono::system_clock::now().time_since_epoch())
                                    .count());
}

bool Date_t::isFormattable() const {
    return _millis >= 0;
}

std::string Date_t::toString() const {
    if (!isFormattable())
        return fmt::format("Date({})", _millis);

    std::time_t secs = static_cast<std::time_t>(_millis / 1000);
    std::tm t;
    gmtime_r(&secs, &t);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       t.tm_year + 1900,
                       t.tm_mon + 1,
                       t.tm_mday,
                       t.tm_hour,
                       t.tm_min,
                       t.tm_sec,
                       _millis % 1000);
}

std::ostream& operator<<(std::ostream& os, Date_t date) {
    return os << date.toString();
}

}  // namespace shake
