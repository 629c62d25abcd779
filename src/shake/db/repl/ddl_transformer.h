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

#include <string_view>
#include <vector>

#include <boost/optional.hpp>

#include "shake/base/status_with.h"
#include "shake/db/repl/oplog_entry.h"
#include "shake/db/s/shard_collection_spec.h"

namespace shake {
namespace repl {

/**
 * Rewrites a released DDL captured from 'replSetName' into the ordered operations the target
 * must apply.
 *
 * 'shardSpec' is the sharding definition of the DDL's collection on the source cluster, or
 * boost::none if it is not sharded (or the source is not a sharded cluster). 'targetIsSharded'
 * tells whether the target is a sharded cluster.
 *
 *  - An insert into <db>.system.indexes becomes one createIndexes command on the indexed
 *    collection, keeping every field of the index definition.
 *  - 'create' of a sharded collection against a sharded target becomes enableSharding on the
 *    database followed by shardCollection with the source's shard key.
 *  - Other additive and destructive commands are returned unchanged.
 *  - renameCollection, convertToCapped, emptycapped and applyOps fail with IllegalDdlOperation;
 *    any other command fails with UnsupportedDdlOperation. Both are fatal to the caller.
 */
StatusWith<std::vector<OplogEntry>> transformDdl(
    std::string_view replSetName,
    const OplogEntry& entry,
    const boost::optional<ShardCollectionSpec>& shardSpec,
    bool targetIsSharded);

}  // namespace repl
}  // namespace shake
