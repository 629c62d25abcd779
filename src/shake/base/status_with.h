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

#include <concepts>
#include <iosfwd>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "shake/base/error_codes.h"
#include "shake/base/status.h"
#include "shake/util/assert_util.h"

namespace shake {

template <typename T>
class StatusWith;

template <typename T>
inline constexpr bool isStatusWith = false;
template <typename T>
inline constexpr bool isStatusWith<StatusWith<T>> = true;

template <typename T>
inline constexpr bool isStatusOrStatusWith = std::is_same_v<T, Status> || isStatusWith<T>;

/**
 * StatusWith is used to return an error or a value.
 * This class is designed to make exception-free code cleaner by not needing as many out
 * parameters.
 *
 * Example:
 * StatusWith<int> fib( int n ) {
 *   if ( n < 0 )
 *       return StatusWith<int>( ErrorCodes::BadValue, "parameter to fib has to be >= 0" );
 *   if ( n <= 1 ) return StatusWith<int>( 1 );
 *   StatusWith<int> a = fib( n - 1 );
 *   StatusWith<int> b = fib( n - 2 );
 *   if ( !a.isOK() ) return a;
 *   if ( !b.isOK() ) return b;
 *   return StatusWith<int>( a.getValue() + b.getValue() );
 * }
 */
template <typename T>
class [[nodiscard]] StatusWith {
    static_assert(!isStatusOrStatusWith<T>,
                  "StatusWith<Status> and StatusWith<StatusWith<T>> are banned.");

public:
    using value_type = T;

    /**
     * For the error case.
     */
    StatusWith(ErrorCodes::Error code, std::string reason) : _status(code, std::move(reason)) {}

    /**
     * For the error case.
     */
    StatusWith(Status status) : _status(std::move(status)) {
        invariant(!isOK());
    }

    /**
     * For the OK case.
     */
    StatusWith(T t) : _status(Status::OK()), _t(std::move(t)) {}

    template <std::convertible_to<T> U>
    requires(!std::is_same_v<std::decay_t<U>, T>)
    StatusWith(U&& other) : StatusWith(static_cast<T>(std::forward<U>(other))) {}

    const T& getValue() const {
        invariant(isOK());
        return *_t;
    }

    T& getValue() {
        invariant(isOK());
        return *_t;
    }

    const Status& getStatus() const {
        return _status;
    }

    bool isOK() const {
        return _status.isOK();
    }

    bool operator==(const Status& status) const {
        return getStatus() == status;
    }

    bool operator==(ErrorCodes::Error code) const {
        return getStatus() == code;
    }

private:
    Status _status;
    std::optional<T> _t;
};

template <typename T>
auto operator<<(std::ostream& stream, const StatusWith<T>& sw)
    -> decltype(stream << sw.getValue())  // SFINAE on T streamability.
{
    if (sw.isOK())
        return stream << sw.getValue();
    return stream << sw.getStatus();
}

/**
 * Aborts the process with 'msgid' if 'sw' holds an error, otherwise returns its value.
 */
template <typename T>
T fassertWithLocation(int msgid, StatusWith<T> sw, const char* file, unsigned line) {
    if (!sw.isOK())
        fassertFailedWithStatusWithLocation(msgid, sw.getStatus(), file, line);
    return std::move(sw.getValue());
}

}  // namespace shake
