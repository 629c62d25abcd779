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

#include <boost/optional.hpp>

#include "shake/base/status_with.h"
#include "shake/bson/bsonobj.h"
#include "shake/db/namespace_string.h"
#include "shake/db/s/shard_collection_spec.h"

namespace shake {

/**
 * Read access to the sharding catalog of a sharded source cluster.
 */
class ShardingCatalogClient {
public:
    virtual ~ShardingCatalogClient() = default;

    /**
     * Returns the config.collections document for 'nss', or boost::none if the catalog has no
     * entry for it. Returns an error Status if the catalog could not be read.
     */
    virtual StatusWith<boost::optional<BSONObj>> findCollectionEntry(
        const NamespaceString& nss) = 0;

protected:
    ShardingCatalogClient() = default;
};

/**
 * Returns the sharding definition of 'nss', or boost::none if 'nss' is not a sharded collection,
 * including when the catalog records it as dropped.
 */
StatusWith<boost::optional<ShardCollectionSpec>> getShardCollectionSpec(
    ShardingCatalogClient* catalogClient, const NamespaceString& nss);

}  // namespace shake
