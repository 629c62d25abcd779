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

/**
 * Structured logging.
 *
 * Translation units that log must define SHAKE_LOGV2_DEFAULT_COMPONENT to one of the
 * ::shake::logv2::LogComponent values before the first LOGV2 call.
 *
 * Usage:
 *     LOGV2(4615600, "Blocked at DDL", "replSet"_attr = replSet, "ns"_attr = nss);
 *
 * Every call site carries a unique numeric id. The message may reference attributes by name
 * with {fmt} replacement fields, e.g. "Blocked at {ns}".
 */

#include <initializer_list>
#include <string>

#include "shake/logv2/log_attr.h"
#include "shake/logv2/log_component.h"
#include "shake/logv2/log_severity.h"
#include "shake/util/assert_util.h"

namespace shake {
namespace logv2 {
namespace detail {

void doLogImpl(int id,
               LogSeverity severity,
               LogComponent component,
               const char* message,
               std::initializer_list<NamedAttribute> attrs);

}  // namespace detail

/**
 * Returns true if a message of 'severity' logged under 'component' would be emitted.
 */
bool shouldLog(LogComponent component, LogSeverity severity);

/**
 * Sets the minimum severity logged for 'component'. Components start at LogSeverity::Log().
 */
void setMinimumLoggedSeverity(LogComponent component, LogSeverity severity);

/**
 * Names the calling thread in the "ctx" field of the lines it logs.
 */
void setThreadName(std::string name);
const std::string& getThreadName();

}  // namespace logv2
}  // namespace shake

#define LOGV2_IMPL(ID, SEVERITY, COMPONENT, MESSAGE, ...) \
    ::shake::logv2::detail::doLogImpl(ID, SEVERITY, COMPONENT, MESSAGE, {__VA_ARGS__})

#define LOGV2(ID, MESSAGE, ...)                                  \
    LOGV2_IMPL(ID,                                               \
               ::shake::logv2::LogSeverity::Log(),               \
               SHAKE_LOGV2_DEFAULT_COMPONENT,                    \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_INFO(ID, MESSAGE, ...)                             \
    LOGV2_IMPL(ID,                                               \
               ::shake::logv2::LogSeverity::Info(),              \
               SHAKE_LOGV2_DEFAULT_COMPONENT,                    \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_WARNING(ID, MESSAGE, ...)                          \
    LOGV2_IMPL(ID,                                               \
               ::shake::logv2::LogSeverity::Warning(),           \
               SHAKE_LOGV2_DEFAULT_COMPONENT,                    \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_ERROR(ID, MESSAGE, ...)                            \
    LOGV2_IMPL(ID,                                               \
               ::shake::logv2::LogSeverity::Error(),             \
               SHAKE_LOGV2_DEFAULT_COMPONENT,                    \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

/**
 * Logs at fatal severity without terminating; the caller is responsible for aborting.
 */
#define LOGV2_FATAL_CONTINUE(ID, MESSAGE, ...)                   \
    LOGV2_IMPL(ID,                                               \
               ::shake::logv2::LogSeverity::Severe(),            \
               SHAKE_LOGV2_DEFAULT_COMPONENT,                    \
               MESSAGE __VA_OPT__(, ) __VA_ARGS__)

/**
 * Logs at fatal severity and aborts the process.
 */
#define LOGV2_FATAL_NOTRACE(ID, MESSAGE, ...)                               \
    do {                                                                    \
        LOGV2_FATAL_CONTINUE(ID, MESSAGE __VA_OPT__(, ) __VA_ARGS__);       \
        fassertFailed(ID);                                                  \
    } while (false)

#define LOGV2_DEBUG(ID, DLEVEL, MESSAGE, ...)                                          \
    do {                                                                               \
        auto severity_ = ::shake::logv2::LogSeverity::Debug(DLEVEL);                  \
        if (::shake::logv2::shouldLog(SHAKE_LOGV2_DEFAULT_COMPONENT, severity_)) {    \
            LOGV2_IMPL(ID,                                                             \
                       severity_,                                                      \
                       SHAKE_LOGV2_DEFAULT_COMPONENT,                                  \
                       MESSAGE __VA_OPT__(, ) __VA_ARGS__);                            \
        }                                                                              \
    } while (false)
