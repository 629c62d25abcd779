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
#include <string>
#include <string_view>

#include <boost/optional.hpp>

#include "shake/base/status_with.h"
#include "shake/bson/bsonobj.h"
#include "shake/bson/timestamp.h"
#include "shake/db/namespace_string.h"

namespace shake {
namespace repl {

/**
 * A captured oplog record, as read from a source replica set.
 *
 * Only the fields the synchronization pipeline needs are kept:
 *     { ts: <Timestamp>, t: <long>, h: <long>, v: <int>, op: <string>, ns: <string>,
 *       g: <string>, o: <object>, o2: <object>, fromMigrate: <bool> }
 * 'ts', 'op', 'ns' and 'o' are required.
 */
class OplogEntry {
public:
    static constexpr std::string_view kTimestampFieldName = "ts";
    static constexpr std::string_view kTermFieldName = "t";
    static constexpr std::string_view kHashFieldName = "h";
    static constexpr std::string_view kVersionFieldName = "v";
    static constexpr std::string_view kOpTypeFieldName = "op";
    static constexpr std::string_view kNssFieldName = "ns";
    static constexpr std::string_view kGidFieldName = "g";
    static constexpr std::string_view kObjectFieldName = "o";
    static constexpr std::string_view kObject2FieldName = "o2";
    static constexpr std::string_view kFromMigrateFieldName = "fromMigrate";

    // Values of the 'op' field.
    static constexpr std::string_view kOpTypeCommand = "c";
    static constexpr std::string_view kOpTypeInsert = "i";
    static constexpr std::string_view kOpTypeUpdate = "u";
    static constexpr std::string_view kOpTypeDelete = "d";
    static constexpr std::string_view kOpTypeNoop = "n";

    OplogEntry(Timestamp ts, std::string opType, NamespaceString nss, BSONObj object);

    /**
     * Parses and validates a raw oplog document. The returned entry owns its data.
     */
    static StatusWith<OplogEntry> parse(const BSONObj& raw);

    BSONObj toBSON() const;

    std::string toString() const {
        return toBSON().toString();
    }

    Timestamp getTimestamp() const {
        return _ts;
    }

    const std::string& getOpType() const {
        return _opType;
    }

    const NamespaceString& getNss() const {
        return _nss;
    }

    /** The operation body: the command for 'c' entries, the document for inserts. */
    const BSONObj& getObject() const {
        return _object;
    }

    const boost::optional<BSONObj>& getObject2() const {
        return _object2;
    }

    const boost::optional<std::string>& getGid() const {
        return _gid;
    }

    void setGid(boost::optional<std::string> gid) {
        _gid = std::move(gid);
    }

    const boost::optional<long long>& getTerm() const {
        return _term;
    }

    const boost::optional<long long>& getHash() const {
        return _hash;
    }

    bool getFromMigrate() const {
        return _fromMigrate;
    }

    bool isCommand() const {
        return _opType == kOpTypeCommand;
    }

    /**
     * Returns the name of the command for 'c' entries, which is the first field of the body.
     * Returns the empty string for other entries and for an empty body.
     */
    std::string_view getCommandName() const;

private:
    OplogEntry() = default;

    Timestamp _ts;
    boost::optional<long long> _term;
    boost::optional<long long> _hash;
    boost::optional<int> _version;
    std::string _opType;
    NamespaceString _nss;
    boost::optional<std::string> _gid;
    BSONObj _object;
    boost::optional<BSONObj> _object2;
    bool _fromMigrate = false;
};

std::ostream& operator<<(std::ostream& s, const OplogEntry& entry);

}  // namespace repl
}  // namespace shake
