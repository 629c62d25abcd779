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
#include <string>
#include <vector>

#include <boost/log/core/record_view.hpp>
#include <boost/log/sinks/basic_sink_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/shared_ptr.hpp>

namespace shake {
namespace logv2 {

/**
 * Boost.Log sink backend that keeps every rendered line in memory.
 */
class LogCaptureBackend
    : public boost::log::sinks::basic_sink_backend<boost::log::sinks::synchronized_feeding> {
public:
    void consume(const boost::log::record_view& rec);

    std::vector<std::string> getLines() const;

    void clear();

private:
    mutable std::mutex _mutex;
    std::vector<std::string> _lines;
};

/**
 * Attaches a LogCaptureBackend to the Boost.Log core for its lifetime.
 */
class LogCaptureGuard {
public:
    LogCaptureGuard();
    ~LogCaptureGuard();

    LogCaptureGuard(const LogCaptureGuard&) = delete;
    LogCaptureGuard& operator=(const LogCaptureGuard&) = delete;

    std::vector<std::string> getLines() const {
        return _backend->getLines();
    }

    /**
     * Returns the number of captured lines that contain 'needle'.
     */
    int countLinesContaining(const std::string& needle) const;

private:
    using Sink = boost::log::sinks::synchronous_sink<LogCaptureBackend>;

    boost::shared_ptr<LogCaptureBackend> _backend;
    boost::shared_ptr<Sink> _sink;
};

}  // namespace logv2
}  // namespace shake
