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

namespace shake {

/**
 * Timestamp: A combination of a count of seconds since the POSIX epoch plus an ordinal value.
 *
 * Oplog entries of one replica set carry strictly increasing Timestamps; Timestamps of
 * different replica sets of one cluster are comparable because they share a cluster time.
 */
class Timestamp {
public:
    // Maximum Timestamp value.
    static Timestamp max();

    static Timestamp min() {
        return Timestamp();
    }

    /**
     * Constructor that builds a Timestamp from a 64-bit unsigned integer by using
     * the high-order 4 bytes of "v" for the "secs" field and the low-order 4 bytes for the "i"
     * field.
     */
    explicit Timestamp(unsigned long long val) : Timestamp(val >> 32, val) {}

    Timestamp(unsigned a, unsigned b) : i(b), secs(a) {}

    Timestamp() = default;

    unsigned getSecs() const {
        return secs;
    }

    unsigned getInc() const {
        return i;
    }

    unsigned long long asULL() const {
        unsigned long long result = secs;
        result <<= 32;
        result |= i;
        return result;
    }

    long long asLL() const {
        return static_cast<long long>(asULL());
    }

    bool isNull() const {
        return secs == 0;
    }

    /** Renders as "Timestamp(secs, inc)". */
    std::string toString() const;

    /** Renders as the relaxed extended JSON {"$timestamp":{"t":secs,"i":inc}}. */
    std::string jsonString() const;

    bool operator==(const Timestamp& r) const {
        return asULL() == r.asULL();
    }

    std::strong_ordering operator<=>(const Timestamp& r) const {
        return asULL() <=> r.asULL();
    }

private:
    std::uint32_t i = 0;
    std::uint32_t secs = 0;
};

std::ostream& operator<<(std::ostream& s, const Timestamp& ts);

}  // namespace shake
