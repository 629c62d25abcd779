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

#include "shake/db/repl/oplog_entry.h"

#include "shake/bson/bsonobjbuilder.h"
#include "shake/unittest/unittest.h"

namespace shake {
namespace repl {
namespace {

TEST(OplogEntryTest, ParseCommand) {
    BSONObj raw = BSON("ts" << Timestamp(1600000000, 3) << "t" << 5LL << "h" << 0LL << "v" << 2
                            << "op"
                            << "c"
                            << "ns"
                            << "test.$cmd"
                            << "g"
                            << "gid-7"
                            << "o" << BSON("drop" << "coll"));

    auto swEntry = OplogEntry::parse(raw);
    ASSERT_OK(swEntry);
    const auto& entry = swEntry.getValue();

    ASSERT_EQ(Timestamp(1600000000, 3), entry.getTimestamp());
    ASSERT_TRUE(entry.isCommand());
    ASSERT_EQ(NamespaceString("test.$cmd"), entry.getNss());
    ASSERT_EQ("drop", entry.getCommandName());
    ASSERT_TRUE(entry.getGid());
    ASSERT_EQ("gid-7", *entry.getGid());
    ASSERT_TRUE(entry.getTerm());
    ASSERT_EQ(5, *entry.getTerm());
    ASSERT_FALSE(entry.getObject2());
    ASSERT_FALSE(entry.getFromMigrate());
}

TEST(OplogEntryTest, ParsedEntryOwnsItsData) {
    boost::optional<OplogEntry> entry;
    {
        BSONObj raw = BSON("ts" << Timestamp(10, 1) << "op"
                                << "i"
                                << "ns"
                                << "test.coll"
                                << "o" << BSON("_id" << 1 << "x" << "abc"));
        auto swEntry = OplogEntry::parse(raw);
        ASSERT_OK(swEntry);
        entry.emplace(swEntry.getValue());
    }
    ASSERT_BSONOBJ_EQ(BSON("_id" << 1 << "x" << "abc"), entry->getObject());
    ASSERT_EQ("", entry->getCommandName());
}

TEST(OplogEntryTest, RoundTripsThroughBSON) {
    BSONObj raw = BSON("ts" << Timestamp(10, 1) << "op"
                            << "u"
                            << "ns"
                            << "test.coll"
                            << "o" << BSON("$set" << BSON("x" << 1)) << "o2"
                            << BSON("_id" << 1) << "fromMigrate" << true);
    auto swEntry = OplogEntry::parse(raw);
    ASSERT_OK(swEntry);

    auto swReparsed = OplogEntry::parse(swEntry.getValue().toBSON());
    ASSERT_OK(swReparsed);
    ASSERT_BSONOBJ_EQ(swEntry.getValue().toBSON(), swReparsed.getValue().toBSON());
    ASSERT_TRUE(swReparsed.getValue().getObject2());
    ASSERT_TRUE(swReparsed.getValue().getFromMigrate());
}

TEST(OplogEntryTest, MissingRequiredFields) {
    auto swEntry = OplogEntry::parse(BSON("op"
                                          << "c"
                                          << "ns"
                                          << "test.$cmd"
                                          << "o" << BSON("drop" << "coll")));
    ASSERT_EQ(ErrorCodes::NoSuchKey, swEntry.getStatus().code());

    swEntry = OplogEntry::parse(BSON("ts" << Timestamp(1, 1) << "op"
                                          << "c"
                                          << "ns"
                                          << "test.$cmd"));
    ASSERT_EQ(ErrorCodes::NoSuchKey, swEntry.getStatus().code());
}

TEST(OplogEntryTest, WrongFieldTypes) {
    auto swEntry = OplogEntry::parse(BSON("ts" << 12 << "op"
                                               << "c"
                                               << "ns"
                                               << "test.$cmd"
                                               << "o" << BSON("drop" << "coll")));
    ASSERT_EQ(ErrorCodes::TypeMismatch, swEntry.getStatus().code());

    swEntry = OplogEntry::parse(BSON("ts" << Timestamp(1, 1) << "op"
                                          << "c"
                                          << "ns"
                                          << "test.$cmd"
                                          << "o"
                                          << "drop"));
    ASSERT_EQ(ErrorCodes::TypeMismatch, swEntry.getStatus().code());
}

}  // namespace
}  // namespace repl
}  // namespace shake
