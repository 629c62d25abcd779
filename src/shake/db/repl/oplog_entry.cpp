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

#include <ostream>

#include "shake/bson/bson_validate.h"
#include "shake/bson/bsonobjbuilder.h"
#include "shake/util/str.h"

namespace shake {
namespace repl {

namespace {

Status typeMismatch(std::string_view field, BSONType expected, const BSONElement& actual) {
    return Status(ErrorCodes::TypeMismatch,
                  str::stream() << "oplog entry field '" << field << "' must be of type "
                                << typeName(expected) << ", found " << typeName(actual.type()));
}

Status missingField(std::string_view field) {
    return Status(ErrorCodes::NoSuchKey,
                  str::stream() << "oplog entry is missing required field '" << field << "'");
}

}  // namespace

OplogEntry::OplogEntry(Timestamp ts, std::string opType, NamespaceString nss, BSONObj object)
    : _ts(ts), _opType(std::move(opType)), _nss(std::move(nss)), _object(object.getOwned()) {}

StatusWith<OplogEntry> OplogEntry::parse(const BSONObj& raw) {
    if (auto status = validateBSON(raw); !status.isOK())
        return status.withContext("invalid oplog entry");

    BSONObj owned = raw.getOwned();
    OplogEntry entry;
    bool haveTs = false, haveOp = false, haveNs = false, haveObject = false;

    for (auto&& elem : owned) {
        const auto name = elem.fieldNameStringData();
        if (name == kTimestampFieldName) {
            if (elem.type() != BSONType::timestamp)
                return typeMismatch(name, BSONType::timestamp, elem);
            entry._ts = elem.timestamp();
            haveTs = true;
        } else if (name == kOpTypeFieldName) {
            if (elem.type() != BSONType::string)
                return typeMismatch(name, BSONType::string, elem);
            entry._opType = elem.str();
            haveOp = true;
        } else if (name == kNssFieldName) {
            if (elem.type() != BSONType::string)
                return typeMismatch(name, BSONType::string, elem);
            entry._nss = NamespaceString(elem.str());
            haveNs = true;
        } else if (name == kObjectFieldName) {
            if (elem.type() != BSONType::object)
                return typeMismatch(name, BSONType::object, elem);
            entry._object = elem.Obj().getOwned();
            haveObject = true;
        } else if (name == kObject2FieldName) {
            if (elem.type() != BSONType::object)
                return typeMismatch(name, BSONType::object, elem);
            entry._object2 = elem.Obj().getOwned();
        } else if (name == kGidFieldName) {
            if (elem.type() != BSONType::string)
                return typeMismatch(name, BSONType::string, elem);
            entry._gid = elem.str();
        } else if (name == kTermFieldName) {
            if (!elem.isNumber())
                return typeMismatch(name, BSONType::numberLong, elem);
            entry._term = elem.numberLong();
        } else if (name == kHashFieldName) {
            if (!elem.isNumber())
                return typeMismatch(name, BSONType::numberLong, elem);
            entry._hash = elem.numberLong();
        } else if (name == kVersionFieldName) {
            if (!elem.isNumber())
                return typeMismatch(name, BSONType::numberInt, elem);
            entry._version = elem.numberInt();
        } else if (name == kFromMigrateFieldName) {
            entry._fromMigrate = elem.trueValue();
        }
        // Other fields (wall clock time, session info, ...) are not needed downstream.
    }

    if (!haveTs)
        return missingField(kTimestampFieldName);
    if (!haveOp)
        return missingField(kOpTypeFieldName);
    if (!haveNs)
        return missingField(kNssFieldName);
    if (!haveObject)
        return missingField(kObjectFieldName);

    return entry;
}

BSONObj OplogEntry::toBSON() const {
    BSONObjBuilder b;
    b.append(kTimestampFieldName, _ts);
    if (_term)
        b.appendNumberLong(kTermFieldName, *_term);
    if (_hash)
        b.appendNumberLong(kHashFieldName, *_hash);
    if (_version)
        b.appendNumberInt(kVersionFieldName, *_version);
    b.append(kOpTypeFieldName, _opType);
    b.append(kNssFieldName, _nss.ns());
    if (_gid)
        b.append(kGidFieldName, *_gid);
    b.append(kObjectFieldName, _object);
    if (_object2)
        b.append(kObject2FieldName, *_object2);
    if (_fromMigrate)
        b.append(kFromMigrateFieldName, true);
    return b.obj();
}

std::string_view OplogEntry::getCommandName() const {
    if (!isCommand() || _object.isEmpty())
        return {};
    return _object.firstElementFieldNameStringData();
}

std::ostream& operator<<(std::ostream& s, const OplogEntry& entry) {
    return s << entry.toString();
}

}  // namespace repl
}  // namespace shake
