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

#define SHAKE_LOGV2_DEFAULT_COMPONENT ::shake::logv2::LogComponent::kReplication

#include "shake/db/repl/ddl_transformer.h"

#include "shake/bson/bsonobjbuilder.h"
#include "shake/db/repl/ddl_command.h"
#include "shake/logv2/log.h"
#include "shake/util/str.h"

namespace shake {
namespace repl {

namespace {

OplogEntry makeCommandEntry(const OplogEntry& source, NamespaceString nss, BSONObj command) {
    OplogEntry out(source.getTimestamp(), source.getOpType(), std::move(nss), command);
    out.setGid(source.getGid());
    return out;
}

StatusWith<std::vector<OplogEntry>> transformIndexInsert(
    std::string_view replSetName,
    const OplogEntry& entry,
    const boost::optional<ShardCollectionSpec>& shardSpec) {
    NamespaceString targetNss;
    if (shardSpec) {
        targetNss = shardSpec->getNss();
    } else {
        auto indexedNs = entry.getObject().getStringField(OplogEntry::kNssFieldName);
        if (indexedNs.empty())
            return Status(ErrorCodes::FailedToParse,
                          str::stream() << "index definition from " << replSetName
                                        << " does not name its collection: " << entry);
        targetNss = NamespaceString(std::string(indexedNs));
    }

    BSONObjBuilder command;
    command.append(ddl_command::kCreateIndexes, targetNss.coll());
    command.appendElements(entry.getObject());

    OplogEntry out(entry.getTimestamp(),
                   std::string(OplogEntry::kOpTypeCommand),
                   targetNss,
                   command.obj());
    out.setGid(entry.getGid());

    std::vector<OplogEntry> ops;
    ops.push_back(std::move(out));
    return ops;
}

}  // namespace

StatusWith<std::vector<OplogEntry>> transformDdl(
    std::string_view replSetName,
    const OplogEntry& entry,
    const boost::optional<ShardCollectionSpec>& shardSpec,
    bool targetIsSharded) {
    const auto category = classifyDdl(entry);

    if (category == DdlCommandCategory::kIndexBookkeeping) {
        auto swOps = transformIndexInsert(replSetName, entry, shardSpec);
        if (swOps.isOK()) {
            LOGV2(5210101,
                  "Transformed index insert into createIndexes",
                  "replSet"_attr = replSetName,
                  "ddl"_attr = entry.getObject(),
                  "command"_attr = swOps.getValue().front().getObject());
        }
        return swOps;
    }

    const auto commandName = entry.getCommandName();
    switch (category) {
        case DdlCommandCategory::kAdditive:
            if (commandName == ddl_command::kCreate && targetIsSharded && shardSpec) {
                const std::string db(entry.getNss().db());

                BSONObjBuilder shardCollection;
                shardCollection.append(ddl_command::kShardCollection, shardSpec->getNss().ns());
                shardCollection.append("key", shardSpec->getKeyPattern());
                shardCollection.append("unique", shardSpec->getUnique());

                std::vector<OplogEntry> ops;
                ops.push_back(makeCommandEntry(
                    entry, entry.getNss(), BSON(ddl_command::kEnableSharding << db)));
                ops.push_back(makeCommandEntry(entry, entry.getNss(), shardCollection.obj()));

                LOGV2(5210102,
                      "Transformed create into enableSharding and shardCollection",
                      "replSet"_attr = replSetName,
                      "ddl"_attr = entry.getObject(),
                      "enableSharding"_attr = ops[0].getObject(),
                      "shardCollection"_attr = ops[1].getObject());
                return ops;
            }
            if (commandName == ddl_command::kCreate && targetIsSharded) {
                LOGV2_WARNING(5210103,
                              "Creating collection unsharded on sharded target, no shard key "
                              "is known for it on the source",
                              "replSet"_attr = replSetName,
                              "ns"_attr = entry.getNss(),
                              "ddl"_attr = entry.getObject());
            }
            [[fallthrough]];
        case DdlCommandCategory::kDestructive: {
            std::vector<OplogEntry> ops;
            ops.push_back(entry);
            return ops;
        }
        case DdlCommandCategory::kUnsupported:
            return Status(ErrorCodes::IllegalDdlOperation,
                          str::stream() << "illegal DDL from " << replSetName << ": " << entry);
        case DdlCommandCategory::kIndexBookkeeping:
        case DdlCommandCategory::kUnknown:
            break;
    }
    return Status(ErrorCodes::UnsupportedDdlOperation,
                  str::stream() << "unsupported DDL from " << replSetName << ": " << entry);
}

}  // namespace repl
}  // namespace shake
