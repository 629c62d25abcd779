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

#include <string>

#include "shake/base/status_with.h"
#include "shake/bson/bsonobj.h"
#include "shake/db/namespace_string.h"

namespace shake {

/**
 * The sharding definition of one collection, as recorded in the source cluster's
 * config.collections:
 *
 *     { _id: "<db>.<coll>", key: { <shard key pattern> }, unique: <bool>, dropped: <bool> }
 */
class ShardCollectionSpec {
public:
    static constexpr std::string_view kNssFieldName = "_id";
    static constexpr std::string_view kKeyPatternFieldName = "key";
    static constexpr std::string_view kUniqueFieldName = "unique";
    static constexpr std::string_view kDroppedFieldName = "dropped";

    ShardCollectionSpec(NamespaceString nss, BSONObj keyPattern, bool unique);

    /**
     * Parses a config.collections document. 'dropped' is reported through isDropped(); callers
     * treat a dropped collection as not sharded.
     */
    static StatusWith<ShardCollectionSpec> parse(const BSONObj& doc);

    const NamespaceString& getNss() const {
        return _nss;
    }

    const BSONObj& getKeyPattern() const {
        return _keyPattern;
    }

    bool getUnique() const {
        return _unique;
    }

    bool isDropped() const {
        return _dropped;
    }

    BSONObj toBSON() const;

    std::string toString() const {
        return toBSON().toString();
    }

private:
    NamespaceString _nss;
    BSONObj _keyPattern;
    bool _unique = false;
    bool _dropped = false;
};

}  // namespace shake
