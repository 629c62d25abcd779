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

#include <array>
#include <atomic>
#include <string>

#include <boost/log/sources/severity_logger.hpp>

#include "shake/logv2/log_component.h"
#include "shake/logv2/log_severity.h"

namespace shake {
namespace logv2 {

/**
 * Process-wide logging state: the Boost.Log source every LOGV2 call writes through and the
 * per-component minimum severities.
 *
 * The default console sink is attached on first use; additional sinks (such as the capture
 * sink used by tests) are attached directly to the Boost.Log core.
 */
class LogManager {
public:
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    static LogManager& global();

    bool shouldLog(LogComponent component, LogSeverity severity) const;

    void setMinimumLoggedSeverity(LogComponent component, LogSeverity severity);

    /**
     * Writes an already rendered line at 'severity'.
     */
    void write(LogSeverity severity, const std::string& line);

private:
    LogManager();

    std::array<std::atomic<int>, LogComponent::kNumLogComponents> _minimumSeverity;
    boost::log::sources::severity_logger_mt<int> _source;
};

}  // namespace logv2
}  // namespace shake
