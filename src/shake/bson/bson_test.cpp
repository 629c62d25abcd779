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

#include <limits>

#include "shake/bson/bson_validate.h"
#include "shake/bson/bsonobj.h"
#include "shake/bson/bsonobjbuilder.h"

#include "shake/unittest/unittest.h"

namespace shake {
namespace {

TEST(BSONObjBuilderTest, BuildsAndReadsFields) {
    BSONObj obj = BSON("name" << "joe" << "age" << 33 << "big" << 5000000000LL << "pi" << 3.5
                              << "ok" << true << "ts" << Timestamp(7, 2) << "sub"
                              << BSON("a" << 1));

    ASSERT_EQ(7, obj.nFields());
    ASSERT_EQ("joe", obj.getStringField("name"));
    ASSERT_EQ(BSONType::numberInt, obj["age"].type());
    ASSERT_EQ(33, obj["age"].numberInt());
    ASSERT_EQ(BSONType::numberLong, obj["big"].type());
    ASSERT_EQ(5000000000LL, obj["big"].numberLong());
    ASSERT_EQ(3.5, obj["pi"].numberDouble());
    ASSERT_TRUE(obj.getBoolField("ok"));
    ASSERT_EQ(Timestamp(7, 2), obj["ts"].timestamp());
    ASSERT_EQ(1, obj.getObjectField("sub")["a"].numberInt());
    ASSERT_TRUE(obj["missing"].eoo());
    ASSERT_EQ("name", obj.firstElementFieldNameStringData());
}

TEST(BSONObjBuilderTest, EmptyObject) {
    BSONObj empty;
    ASSERT_TRUE(empty.isEmpty());
    ASSERT_EQ(5, empty.objsize());
    ASSERT_EQ("{}", empty.toString());
    ASSERT_BSONOBJ_EQ(empty, BSONObjBuilder().obj());
}

TEST(BSONObjBuilderTest, Arrays) {
    BSONObj obj = BSON("list" << BSON_ARRAY(1 << "two" << BSON("three" << 3)));
    ASSERT_EQ(BSONType::array, obj["list"].type());
    ASSERT_EQ(3, obj["list"].Obj().nFields());
    ASSERT_EQ("{ list: [ 1, \"two\", { three: 3 } ] }", obj.toString());
    ASSERT_EQ(R"({"list":[1,"two",{"three":3}]})", obj.jsonString());
}

TEST(BSONObjTest, EqualityIsByteWise) {
    ASSERT_TRUE(BSON("a" << 1).binaryEqual(BSON("a" << 1)));
    ASSERT_FALSE(BSON("a" << 1).binaryEqual(BSON("a" << 1LL)));
    ASSERT_FALSE(BSON("a" << 1 << "b" << 2).binaryEqual(BSON("b" << 2 << "a" << 1)));
}

TEST(BSONObjTest, GetOwnedOutlivesSource) {
    BSONObj owned;
    {
        BSONObj outer = BSON("inner" << BSON("x" << "y"));
        BSONObj view = outer["inner"].Obj();
        ASSERT_FALSE(view.isOwned());
        owned = view.getOwned();
    }
    ASSERT_TRUE(owned.isOwned());
    ASSERT_BSONOBJ_EQ(BSON("x" << "y"), owned);
}

TEST(BSONObjTest, RemoveField) {
    BSONObj obj = BSON("a" << 1 << "b" << 2 << "c" << 3);
    ASSERT_BSONOBJ_EQ(BSON("a" << 1 << "c" << 3), obj.removeField("b"));
    ASSERT_BSONOBJ_EQ(obj, obj.removeField("z"));
}

TEST(BSONElementTest, SafeNumberLongClampsDoubles) {
    BSONObj obj = BSON("nan" << std::numeric_limits<double>::quiet_NaN() << "big" << 1e30
                             << "small" << -1e30 << "plain" << 42.9 << "long" << 7LL);
    ASSERT_EQ(0, obj["nan"].safeNumberLong());
    ASSERT_EQ(std::numeric_limits<long long>::max(), obj["big"].safeNumberLong());
    ASSERT_EQ(std::numeric_limits<long long>::min(), obj["small"].safeNumberLong());
    ASSERT_EQ(42, obj["plain"].safeNumberLong());
    ASSERT_EQ(7, obj["long"].safeNumberLong());
}

TEST(BSONValidateTest, AcceptsBuiltObjects) {
    ASSERT_OK(validateBSON(BSON("a" << BSON_ARRAY(1 << 2) << "b" << BSON("c" << "d"))));
    ASSERT_OK(validateBSON(BSONObj()));
}

TEST(BSONValidateTest, RejectsTruncatedBuffer) {
    BSONObj obj = BSON("a" << "hello");
    std::string bytes = obj.toBuffer();
    ASSERT_EQ(ErrorCodes::InvalidBSON,
              validateBSON(bytes.data(), bytes.size() - 1).code());
}

TEST(BSONValidateTest, RejectsUnknownType) {
    const char raw[] = {0x08, 0x00, 0x00, 0x00, 0x7e, 'a', 0x00, 0x00};
    ASSERT_EQ(ErrorCodes::InvalidBSON, validateBSON(raw, sizeof(raw)).code());
}

TEST(BSONValidateTest, RejectsBadStringLength) {
    // { a: "x" } with the string length claiming 100 bytes.
    const char raw[] = {0x0e, 0x00, 0x00, 0x00, 0x02, 'a', 0x00, 0x64, 0x00, 0x00, 0x00, 'x', 0x00,
                        0x00};
    ASSERT_EQ(ErrorCodes::InvalidBSON, validateBSON(raw, sizeof(raw)).code());
}

TEST(TimestampTest, Ordering) {
    ASSERT_LT(Timestamp(1, 5), Timestamp(2, 0));
    ASSERT_LT(Timestamp(2, 0), Timestamp(2, 1));
    ASSERT_EQ(Timestamp(0x0000000100000002ULL), Timestamp(1, 2));
    ASSERT_LT(Timestamp(4000000000U, 0), Timestamp::max());
    ASSERT_EQ("Timestamp(3, 4)", Timestamp(3, 4).toString());
}

}  // namespace
}  // namespace shake
