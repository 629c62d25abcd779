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

#include <iosfwd>
#include <string_view>

#include <boost/optional.hpp>

#include "shake/db/namespace_string.h"
#include "shake/db/repl/oplog_entry.h"

namespace shake {
namespace repl {

/**
 * How a DDL is treated by the elimination loop and the transformer.
 */
enum class DdlCommandCategory {
    // create, createIndexes, collMod: cannot lose data when applied early.
    kAdditive,
    // drop, dropDatabase, dropIndex(es), deleteIndex(es): must wait for every source.
    kDestructive,
    // renameCollection, convertToCapped, emptycapped, applyOps: no safe multi-source
    // translation exists.
    kUnsupported,
    // An insert into <db>.system.indexes.
    kIndexBookkeeping,
    kUnknown,
};

std::string_view toString(DdlCommandCategory category);
std::ostream& operator<<(std::ostream& os, DdlCommandCategory category);

namespace ddl_command {
constexpr std::string_view kCreate = "create";
constexpr std::string_view kCreateIndexes = "createIndexes";
constexpr std::string_view kCollMod = "collMod";
constexpr std::string_view kDrop = "drop";
constexpr std::string_view kDropDatabase = "dropDatabase";
constexpr std::string_view kDropIndex = "dropIndex";
constexpr std::string_view kDropIndexes = "dropIndexes";
constexpr std::string_view kDeleteIndex = "deleteIndex";
constexpr std::string_view kDeleteIndexes = "deleteIndexes";
constexpr std::string_view kRenameCollection = "renameCollection";
constexpr std::string_view kConvertToCapped = "convertToCapped";
constexpr std::string_view kEmptyCapped = "emptycapped";
constexpr std::string_view kApplyOps = "applyOps";

constexpr std::string_view kEnableSharding = "enableSharding";
constexpr std::string_view kShardCollection = "shardCollection";
}  // namespace ddl_command

/**
 * Classifies a command by name. Names are matched case sensitively.
 */
DdlCommandCategory classifyDdlCommand(std::string_view commandName);

/**
 * Classifies a captured DDL entry: inserts into system.indexes are index bookkeeping regardless
 * of their body, everything else is classified by its command name.
 */
DdlCommandCategory classifyDdl(const OplogEntry& entry);

/**
 * Returns true if 'entry' must go through the DDL barrier rather than being applied in stream
 * order: every command entry and every insert into a system.indexes collection.
 */
bool isDdlEntry(const OplogEntry& entry);

/**
 * Returns the collection a DDL acts on, used to look up its sharding definition:
 *  - for system.indexes inserts, the 'ns' field of the index definition;
 *  - for renameCollection, the source namespace it names;
 *  - for other commands, <db>.<first field value> when that value is a string.
 * Returns boost::none when the DDL does not name a collection, e.g. dropDatabase.
 */
boost::optional<NamespaceString> getDdlTargetCollection(const OplogEntry& entry);

}  // namespace repl
}  // namespace shake
