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

#include "shake/db/repl/ddl_command.h"

#include "shake/bson/bsonobjbuilder.h"
#include "shake/unittest/unittest.h"

namespace shake {
namespace repl {
namespace {

OplogEntry makeCommand(std::string_view ns, const BSONObj& command) {
    return OplogEntry(Timestamp(1, 1), "c", NamespaceString(std::string(ns)), command);
}

TEST(DdlCommandTest, ClassifiesCommandNames) {
    for (auto name : {"create", "createIndexes", "collMod"})
        ASSERT_EQ(DdlCommandCategory::kAdditive, classifyDdlCommand(name)) << name;

    for (auto name : {"drop",
                      "dropDatabase",
                      "dropIndex",
                      "dropIndexes",
                      "deleteIndex",
                      "deleteIndexes"})
        ASSERT_EQ(DdlCommandCategory::kDestructive, classifyDdlCommand(name)) << name;

    for (auto name : {"renameCollection", "convertToCapped", "emptycapped", "applyOps"})
        ASSERT_EQ(DdlCommandCategory::kUnsupported, classifyDdlCommand(name)) << name;

    for (auto name : {"compact", "Drop", ""})
        ASSERT_EQ(DdlCommandCategory::kUnknown, classifyDdlCommand(name)) << name;
}

TEST(DdlCommandTest, IndexInsertsAreBookkeeping) {
    OplogEntry insert(Timestamp(1, 1),
                      "i",
                      NamespaceString("test.system.indexes"),
                      BSON("ns" << "test.coll" << "key" << BSON("a" << 1)));
    ASSERT_EQ(DdlCommandCategory::kIndexBookkeeping, classifyDdl(insert));
    ASSERT_TRUE(isDdlEntry(insert));
}

TEST(DdlCommandTest, OnlyCommandsAndIndexInsertsAreDdl) {
    ASSERT_TRUE(isDdlEntry(makeCommand("test.$cmd", BSON("drop" << "coll"))));

    OplogEntry insert(Timestamp(1, 1), "i", NamespaceString("test.coll"), BSON("_id" << 1));
    ASSERT_FALSE(isDdlEntry(insert));
    ASSERT_EQ(DdlCommandCategory::kUnknown, classifyDdl(insert));
}

TEST(DdlCommandTest, TargetCollectionOfCommands) {
    auto nss = getDdlTargetCollection(makeCommand("test.$cmd", BSON("drop" << "coll")));
    ASSERT_TRUE(nss);
    ASSERT_EQ(NamespaceString("test.coll"), *nss);

    nss = getDdlTargetCollection(makeCommand(
        "admin.$cmd", BSON("renameCollection" << "test.coll" << "to" << "test.other")));
    ASSERT_TRUE(nss);
    ASSERT_EQ(NamespaceString("test.coll"), *nss);

    ASSERT_FALSE(getDdlTargetCollection(makeCommand("test.$cmd", BSON("dropDatabase" << 1))));
    ASSERT_FALSE(getDdlTargetCollection(makeCommand("test.$cmd", BSONObj())));
}

TEST(DdlCommandTest, TargetCollectionOfIndexInserts) {
    OplogEntry insert(Timestamp(1, 1),
                      "i",
                      NamespaceString("test.system.indexes"),
                      BSON("ns" << "test.coll" << "key" << BSON("a" << 1)));
    auto nss = getDdlTargetCollection(insert);
    ASSERT_TRUE(nss);
    ASSERT_EQ(NamespaceString("test.coll"), *nss);

    OplogEntry noNs(Timestamp(1, 1),
                    "i",
                    NamespaceString("test.system.indexes"),
                    BSON("key" << BSON("a" << 1)));
    ASSERT_FALSE(getDdlTargetCollection(noNs));
}

}  // namespace
}  // namespace repl
}  // namespace shake
