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
 * Unit test support. Tests are written against GoogleTest, plus assertions for the project's
 * own Status and BSON types.
 */

#include <gtest/gtest.h>

#include "shake/base/status.h"
#include "shake/base/status_with.h"
#include "shake/bson/bsonobj.h"

namespace shake {
namespace unittest {

using Test = ::testing::Test;

namespace detail {

inline const Status& toStatus(const Status& s) {
    return s;
}

template <typename T>
const Status& toStatus(const StatusWith<T>& sw) {
    return sw.getStatus();
}

inline ::testing::AssertionResult bsonObjEqual(const char* aExpr,
                                               const char* bExpr,
                                               const BSONObj& a,
                                               const BSONObj& b) {
    if (a.binaryEqual(b))
        return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
        << "Expected " << aExpr << " == " << bExpr << " (" << a.toString()
        << " == " << b.toString() << ")";
}

}  // namespace detail
}  // namespace unittest
}  // namespace shake

/**
 * Fails unless "EXPRESSION" is Status::OK() or a StatusWith holding a value.
 */
#define ASSERT_OK(EXPRESSION) \
    ASSERT_EQ(::shake::Status::OK(), ::shake::unittest::detail::toStatus(EXPRESSION))

#define ASSERT_NOT_OK(EXPRESSION) \
    ASSERT_NE(::shake::Status::OK(), ::shake::unittest::detail::toStatus(EXPRESSION))

/**
 * Fails unless the two BSONObj have identical bytes.
 */
#define ASSERT_BSONOBJ_EQ(a, b) ASSERT_PRED_FORMAT2(::shake::unittest::detail::bsonObjEqual, a, b)

#define ASSERT_LTE(a, b) ASSERT_LE(a, b)
#define ASSERT_GTE(a, b) ASSERT_GE(a, b)
