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

#include "shake/bson/bsontypes.h"

#include <ostream>

namespace shake {

bool isValidBSONType(int type) {
    switch (static_cast<BSONType>(type)) {
        case BSONType::minKey:
        case BSONType::eoo:
        case BSONType::numberDouble:
        case BSONType::string:
        case BSONType::object:
        case BSONType::array:
        case BSONType::binData:
        case BSONType::undefined:
        case BSONType::oid:
        case BSONType::boolean:
        case BSONType::date:
        case BSONType::null:
        case BSONType::regEx:
        case BSONType::numberInt:
        case BSONType::timestamp:
        case BSONType::numberLong:
        case BSONType::numberDecimal:
        case BSONType::maxKey:
            return true;
    }
    return false;
}

const char* typeName(BSONType type) {
    switch (type) {
        case BSONType::minKey:
            return "minKey";
        case BSONType::eoo:
            return "missing";
        case BSONType::numberDouble:
            return "double";
        case BSONType::string:
            return "string";
        case BSONType::object:
            return "object";
        case BSONType::array:
            return "array";
        case BSONType::binData:
            return "binData";
        case BSONType::undefined:
            return "undefined";
        case BSONType::oid:
            return "objectId";
        case BSONType::boolean:
            return "bool";
        case BSONType::date:
            return "date";
        case BSONType::null:
            return "null";
        case BSONType::regEx:
            return "regex";
        case BSONType::numberInt:
            return "int";
        case BSONType::timestamp:
            return "timestamp";
        case BSONType::numberLong:
            return "long";
        case BSONType::numberDecimal:
            return "decimal";
        case BSONType::maxKey:
            return "maxKey";
    }
    return "invalid";
}

std::ostream& operator<<(std::ostream& stream, BSONType type) {
    return stream << typeName(type);
}

}  // namespace shake
