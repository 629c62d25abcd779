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

#include "shake/base/status.h"

#include "shake/base/status_with.h"
#include "shake/unittest/unittest.h"

namespace shake {
namespace {

TEST(StatusTest, OK) {
    Status s = Status::OK();
    ASSERT_TRUE(s.isOK());
    ASSERT_EQ(ErrorCodes::OK, s.code());
    ASSERT_EQ("", s.reason());
    ASSERT_EQ("OK", s.toString());
}

TEST(StatusTest, Error) {
    Status s(ErrorCodes::DdlNotRegistered, "no such DDL");
    ASSERT_FALSE(s.isOK());
    ASSERT_EQ(ErrorCodes::DdlNotRegistered, s.code());
    ASSERT_EQ("DdlNotRegistered", s.codeString());
    ASSERT_EQ("DdlNotRegistered: no such DDL", s.toString());
    ASSERT_TRUE(s == ErrorCodes::DdlNotRegistered);
}

TEST(StatusTest, WithContext) {
    Status s = Status(ErrorCodes::InvalidBSON, "bad size").withContext("cannot identify DDL");
    ASSERT_EQ(ErrorCodes::InvalidBSON, s.code());
    ASSERT_EQ("cannot identify DDL :: caused by :: bad size", s.reason());

    ASSERT_OK(Status::OK().withContext("ignored"));
}

TEST(StatusTest, CopiesShareReason) {
    Status a(ErrorCodes::BadValue, "x");
    Status b = a;
    ASSERT_EQ(a, b);
    ASSERT_EQ(a.reason(), b.reason());
}

TEST(StatusTest, UnknownCodeName) {
    ASSERT_EQ("Location12345", ErrorCodes::errorString(static_cast<ErrorCodes::Error>(12345)));
    ASSERT_EQ(ErrorCodes::IllegalDdlOperation, ErrorCodes::fromString("IllegalDdlOperation"));
    ASSERT_EQ(ErrorCodes::UnknownError, ErrorCodes::fromString("NotACode"));
}

TEST(StatusWithTest, ValueAndError) {
    StatusWith<int> value(5);
    ASSERT_OK(value);
    ASSERT_EQ(5, value.getValue());

    StatusWith<int> error(ErrorCodes::BadValue, "negative");
    ASSERT_NOT_OK(error);
    ASSERT_EQ(ErrorCodes::BadValue, error.getStatus().code());
    ASSERT_TRUE(error == ErrorCodes::BadValue);
}

TEST(StatusWithTest, ConvertsFromCompatibleValue) {
    StatusWith<std::string> sw("text");
    ASSERT_OK(sw);
    ASSERT_EQ("text", sw.getValue());
}

}  // namespace
}  // namespace shake
