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

#include "shake/db/s/shard_collection_spec.h"

#include "shake/bson/bsonobjbuilder.h"
#include "shake/db/s/sharding_catalog_client_mock.h"
#include "shake/unittest/unittest.h"

namespace shake {
namespace {

const NamespaceString kNss("test.coll");

TEST(ShardCollectionSpecTest, ParseCollectionEntry) {
    auto swSpec = ShardCollectionSpec::parse(
        BSON("_id" << "test.coll" << "lastmodEpoch" << 1 << "key" << BSON("x" << "hashed")
                   << "unique" << true));
    ASSERT_OK(swSpec);
    const auto& spec = swSpec.getValue();
    ASSERT_EQ(kNss, spec.getNss());
    ASSERT_BSONOBJ_EQ(BSON("x" << "hashed"), spec.getKeyPattern());
    ASSERT_TRUE(spec.getUnique());
    ASSERT_FALSE(spec.isDropped());
}

TEST(ShardCollectionSpecTest, UniqueDefaultsToFalse) {
    auto swSpec = ShardCollectionSpec::parse(BSON("_id" << "test.coll" << "key" << BSON("x" << 1)));
    ASSERT_OK(swSpec);
    ASSERT_FALSE(swSpec.getValue().getUnique());
}

TEST(ShardCollectionSpecTest, RejectsMalformedEntries) {
    ASSERT_EQ(ErrorCodes::NoSuchKey,
              ShardCollectionSpec::parse(BSON("key" << BSON("x" << 1))).getStatus().code());
    ASSERT_EQ(ErrorCodes::TypeMismatch,
              ShardCollectionSpec::parse(BSON("_id" << 5)).getStatus().code());
    ASSERT_EQ(ErrorCodes::TypeMismatch,
              ShardCollectionSpec::parse(BSON("_id" << "test.coll" << "key" << "x"))
                  .getStatus()
                  .code());
    ASSERT_EQ(ErrorCodes::InvalidNamespace,
              ShardCollectionSpec::parse(BSON("_id" << "")).getStatus().code());
}

TEST(ShardingCatalogClientTest, ShardedCollection) {
    ShardingCatalogClientMock catalog;
    catalog.setShardedCollection(ShardCollectionSpec(kNss, BSON("x" << 1), false));

    auto swSpec = getShardCollectionSpec(&catalog, kNss);
    ASSERT_OK(swSpec);
    ASSERT_TRUE(swSpec.getValue());
    ASSERT_BSONOBJ_EQ(BSON("x" << 1), swSpec.getValue()->getKeyPattern());
}

TEST(ShardingCatalogClientTest, MissingOrDroppedCollectionIsNotSharded) {
    ShardingCatalogClientMock catalog;
    auto swSpec = getShardCollectionSpec(&catalog, kNss);
    ASSERT_OK(swSpec);
    ASSERT_FALSE(swSpec.getValue());

    catalog.setCollectionEntry(
        kNss, BSON("_id" << kNss.ns() << "key" << BSON("x" << 1) << "dropped" << true));
    swSpec = getShardCollectionSpec(&catalog, kNss);
    ASSERT_OK(swSpec);
    ASSERT_FALSE(swSpec.getValue());
}

TEST(ShardingCatalogClientTest, ReadErrorsPropagate) {
    ShardingCatalogClientMock catalog;
    catalog.setReadError(Status(ErrorCodes::InternalError, "unreachable"));

    auto swSpec = getShardCollectionSpec(&catalog, kNss);
    ASSERT_EQ(ErrorCodes::InternalError, swSpec.getStatus().code());
    ASSERT_EQ(1, catalog.getNumLookups());
}

}  // namespace
}  // namespace shake
