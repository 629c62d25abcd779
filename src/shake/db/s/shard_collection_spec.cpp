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
#include "shake/util/str.h"

namespace shake {

ShardCollectionSpec::ShardCollectionSpec(NamespaceString nss, BSONObj keyPattern, bool unique)
    : _nss(std::move(nss)), _keyPattern(keyPattern.getOwned()), _unique(unique) {}

StatusWith<ShardCollectionSpec> ShardCollectionSpec::parse(const BSONObj& doc) {
    BSONElement nssElem = doc[kNssFieldName];
    if (nssElem.eoo())
        return Status(ErrorCodes::NoSuchKey,
                      str::stream() << "collection entry is missing '" << kNssFieldName
                                    << "': " << doc);
    if (nssElem.type() != BSONType::string)
        return Status(ErrorCodes::TypeMismatch,
                      str::stream() << "collection entry field '" << kNssFieldName
                                    << "' must be a string, found "
                                    << typeName(nssElem.type()));

    auto swNss = NamespaceString::parse(nssElem.valueStringData());
    if (!swNss.isOK())
        return swNss.getStatus();

    BSONObj keyPattern;
    if (BSONElement keyElem = doc[kKeyPatternFieldName]; !keyElem.eoo()) {
        if (keyElem.type() != BSONType::object)
            return Status(ErrorCodes::TypeMismatch,
                          str::stream() << "shard key pattern of " << swNss.getValue()
                                        << " must be an object, found "
                                        << typeName(keyElem.type()));
        keyPattern = keyElem.Obj();
    }

    ShardCollectionSpec spec(
        std::move(swNss.getValue()), keyPattern, doc.getBoolField(kUniqueFieldName));
    spec._dropped = doc.getBoolField(kDroppedFieldName);
    return spec;
}

BSONObj ShardCollectionSpec::toBSON() const {
    BSONObjBuilder b;
    b.append(kNssFieldName, _nss.ns());
    b.append(kKeyPatternFieldName, _keyPattern);
    b.append(kUniqueFieldName, _unique);
    if (_dropped)
        b.append(kDroppedFieldName, true);
    return b.obj();
}

}  // namespace shake
