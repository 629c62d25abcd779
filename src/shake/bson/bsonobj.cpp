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

#include "shake/bson/bsonobj.h"

#include <cstring>
#include <ostream>

#include "shake/bson/bsonobjbuilder.h"

namespace shake {

namespace {

const char kEmptyObject[] = {5, 0, 0, 0, 0};

}  // namespace

BSONObj::BSONObj() : _objdata(kEmptyObject) {}

BSONObj BSONObj::takeOwnership(std::string buffer) {
    auto holder = std::make_shared<const std::string>(std::move(buffer));
    BSONObj obj(holder->data());
    obj._holder = std::move(holder);
    return obj;
}

BSONObj BSONObj::getOwned() const {
    if (isOwned())
        return *this;
    return takeOwnership(toBuffer());
}

int BSONObj::nFields() const {
    int n = 0;
    for (auto it = begin(); it != end(); ++it) {
        ++n;
    }
    return n;
}

BSONElement BSONObj::getField(std::string_view name) const {
    for (auto&& elem : *this) {
        if (elem.fieldNameStringData() == name)
            return elem;
    }
    return BSONElement();
}

std::string_view BSONObj::getStringField(std::string_view name) const {
    return getField(name).valueStringDataSafe();
}

BSONObj BSONObj::getObjectField(std::string_view name) const {
    auto elem = getField(name);
    return elem.type() == BSONType::object ? elem.embeddedObject() : BSONObj();
}

bool BSONObj::getBoolField(std::string_view name) const {
    return getField(name).trueValue();
}

bool BSONObj::binaryEqual(const BSONObj& r) const {
    int os = objsize();
    if (os == r.objsize()) {
        return (os == 0 || std::memcmp(objdata(), r.objdata(), os) == 0);
    }
    return false;
}

BSONObj BSONObj::removeField(std::string_view name) const {
    BSONObjBuilder b;
    for (auto&& elem : *this) {
        if (elem.fieldNameStringData() != name)
            b.append(elem);
    }
    return b.obj();
}

std::string BSONObj::toString() const {
    if (isEmpty())
        return "{}";

    std::string out = "{ ";
    bool first = true;
    for (auto&& elem : *this) {
        if (!first)
            out += ", ";
        out += elem.toString();
        first = false;
    }
    out += " }";
    return out;
}

std::string BSONObj::jsonString() const {
    std::string out = "{";
    bool first = true;
    for (auto&& elem : *this) {
        if (!first)
            out += ",";
        out += elem.jsonString();
        first = false;
    }
    out += "}";
    return out;
}

std::ostream& operator<<(std::ostream& s, const BSONObj& o) {
    return s << o.toString();
}

}  // namespace shake
