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

#include <ostream>

namespace shake {
namespace repl {

std::string_view toString(DdlCommandCategory category) {
    switch (category) {
        case DdlCommandCategory::kAdditive:
            return "additive";
        case DdlCommandCategory::kDestructive:
            return "destructive";
        case DdlCommandCategory::kUnsupported:
            return "unsupported";
        case DdlCommandCategory::kIndexBookkeeping:
            return "indexBookkeeping";
        case DdlCommandCategory::kUnknown:
            return "unknown";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, DdlCommandCategory category) {
    return os << toString(category);
}

DdlCommandCategory classifyDdlCommand(std::string_view commandName) {
    using namespace ddl_command;
    if (commandName == kCreate || commandName == kCreateIndexes || commandName == kCollMod)
        return DdlCommandCategory::kAdditive;
    if (commandName == kDeleteIndex || commandName == kDeleteIndexes ||
        commandName == kDropIndex || commandName == kDropIndexes ||
        commandName == kDropDatabase || commandName == kDrop)
        return DdlCommandCategory::kDestructive;
    if (commandName == kRenameCollection || commandName == kConvertToCapped ||
        commandName == kEmptyCapped || commandName == kApplyOps)
        return DdlCommandCategory::kUnsupported;
    return DdlCommandCategory::kUnknown;
}

DdlCommandCategory classifyDdl(const OplogEntry& entry) {
    if (entry.getNss().isSystemDotIndexes())
        return DdlCommandCategory::kIndexBookkeeping;
    return classifyDdlCommand(entry.getCommandName());
}

bool isDdlEntry(const OplogEntry& entry) {
    if (entry.isCommand())
        return true;
    return entry.getOpType() == OplogEntry::kOpTypeInsert && entry.getNss().isSystemDotIndexes();
}

boost::optional<NamespaceString> getDdlTargetCollection(const OplogEntry& entry) {
    const BSONObj& body = entry.getObject();

    if (entry.getNss().isSystemDotIndexes()) {
        auto ns = body.getStringField(OplogEntry::kNssFieldName);
        if (ns.empty())
            return boost::none;
        return NamespaceString(std::string(ns));
    }

    if (body.isEmpty())
        return boost::none;
    BSONElement first = body.firstElement();
    if (first.type() != BSONType::string)
        return boost::none;
    // renameCollection is logged against admin.$cmd and names its source with the full
    // namespace.
    if (first.fieldNameStringData() == ddl_command::kRenameCollection)
        return NamespaceString(first.str());
    return entry.getNss().getSisterNS(first.valueStringData());
}

}  // namespace repl
}  // namespace shake
