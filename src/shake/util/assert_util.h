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

#include "shake/base/status.h"

namespace shake {

/**
 * This function will call std::abort(). It is preferred to use the invariant() macro rather than
 * calling this function directly.
 */
[[noreturn]] void invariantFailed(const char* expr, const char* file, unsigned line) noexcept;

/**
 * Reports a fatal, unrecoverable condition identified by 'msgid' and aborts the process.
 *
 * This is the only place where errors returned by the DDL synchronization core are allowed to
 * terminate the process; library code returns a Status instead.
 */
[[noreturn]] void fassertFailedWithLocation(int msgid, const char* file, unsigned line) noexcept;
[[noreturn]] void fassertFailedWithStatusWithLocation(int msgid,
                                                      const Status& status,
                                                      const char* file,
                                                      unsigned line) noexcept;

#define fassertFailed(msgid) ::shake::fassertFailedWithLocation(msgid, __FILE__, __LINE__)
#define fassertFailedWithStatus(msgid, status) \
    ::shake::fassertFailedWithStatusWithLocation(msgid, status, __FILE__, __LINE__)

/**
 * Aborts the process with 'msgid' if the given Status is not OK.
 */
#define fassert(msgid, ...) ::shake::fassertWithLocation(msgid, __VA_ARGS__, __FILE__, __LINE__)

inline void fassertWithLocation(int msgid, bool testOK, const char* file, unsigned line) {
    if (!testOK)
        fassertFailedWithLocation(msgid, file, line);
}

inline void fassertWithLocation(int msgid,
                                const Status& status,
                                const char* file,
                                unsigned line) {
    if (!status.isOK())
        fassertFailedWithStatusWithLocation(msgid, status, file, line);
}

#define invariant(expression)                                           \
    do {                                                                \
        if (!(expression)) {                                            \
            ::shake::invariantFailed(#expression, __FILE__, __LINE__); \
        }                                                               \
    } while (false)

}  // namespace shake
