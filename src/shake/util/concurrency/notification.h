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

#include <condition_variable>
#include <mutex>

#include <boost/optional.hpp>

#include "shake/util/assert_util.h"
#include "shake/util/duration.h"

namespace shake {

/**
 * Allows waiting for a result returned from an asynchronous operation.
 *
 * The value is set at most once; every waiter, including those that start waiting after the
 * value was set, observes the same value.
 */
template <class T>
class Notification {
public:
    Notification() = default;

    Notification(const Notification&) = delete;
    Notification& operator=(const Notification&) = delete;

    /**
     * Returns true if the notification has been set (i.e., the call to get/waitFor would not
     * block).
     */
    explicit operator bool() const {
        std::lock_guard<std::mutex> lk(_mutex);
        return !!_value;
    }

    /**
     * Waits until the notification has been set and returns its value.
     */
    const T& get() const {
        std::unique_lock<std::mutex> lk(_mutex);
        _condVar.wait(lk, [this] { return !!_value; });
        return _value.get();
    }

    /**
     * Sets the notification value and wakes up any threads waiting on get(). May only be called
     * once for the lifetime of the notification.
     */
    void set(T value) {
        std::lock_guard<std::mutex> lk(_mutex);
        invariant(!_value);
        _value = std::move(value);
        _condVar.notify_all();
    }

    /**
     * If the notification is set, returns immediately. Otherwise, blocks until it either becomes
     * set or the 'waitTimeout' expires, whichever comes first. Returns the value if it was set.
     */
    boost::optional<T> waitFor(Milliseconds waitTimeout) const {
        std::unique_lock<std::mutex> lk(_mutex);
        if (!_condVar.wait_for(lk, waitTimeout, [this] { return !!_value; }))
            return boost::none;
        return _value;
    }

private:
    mutable std::mutex _mutex;
    mutable std::condition_variable _condVar;
    boost::optional<T> _value;
};

}  // namespace shake
