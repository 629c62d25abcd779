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

#include "shake/db/namespace_string.h"

#include "shake/unittest/unittest.h"

namespace shake {
namespace {

TEST(NamespaceStringTest, SplitsDatabaseAndCollection) {
    NamespaceString nss("test.system.indexes");
    ASSERT_EQ("test", nss.db());
    ASSERT_EQ("system.indexes", nss.coll());
    ASSERT_TRUE(nss.isSystemDotIndexes());
    ASSERT_FALSE(nss.isCommand());

    NamespaceString dbOnly("test");
    ASSERT_EQ("test", dbOnly.db());
    ASSERT_EQ("", dbOnly.coll());
}

TEST(NamespaceStringTest, CommandNamespace) {
    NamespaceString nss("admin", "$cmd");
    ASSERT_EQ("admin.$cmd", nss.ns());
    ASSERT_TRUE(nss.isCommand());
    ASSERT_EQ(NamespaceString("admin.users"), nss.getSisterNS("users"));
}

TEST(NamespaceStringTest, Parse) {
    ASSERT_OK(NamespaceString::parse("test.coll"));
    ASSERT_EQ(ErrorCodes::InvalidNamespace, NamespaceString::parse("").getStatus().code());
    ASSERT_EQ(ErrorCodes::InvalidNamespace, NamespaceString::parse(".coll").getStatus().code());
}

TEST(NamespaceStringTest, Ordering) {
    ASSERT_LT(NamespaceString("a.b"), NamespaceString("a.c"));
    ASSERT_LT(NamespaceString("a.z"), NamespaceString("b.a"));
    ASSERT_EQ(NamespaceString("a", "b"), NamespaceString("a.b"));
}

}  // namespace
}  // namespace shake
