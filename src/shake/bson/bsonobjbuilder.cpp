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

#include "shake/bson/bsonobjbuilder.h"

#include <cstring>

#include <boost/endian/conversion.hpp>

#include "shake/util/assert_util.h"

namespace shake {

BSONObjBuilder::BSONObjBuilder(int initsize) : _s(this) {
    _buf.reserve(initsize);
    // Reserve space for the total size; it is filled in by obj().
    _appendInt32(0);
}

void BSONObjBuilder::_appendInt32(std::int32_t n) {
    n = boost::endian::native_to_little(n);
    _buf.append(reinterpret_cast<const char*>(&n), sizeof(n));
}

void BSONObjBuilder::_appendInt64(std::int64_t n) {
    n = boost::endian::native_to_little(n);
    _buf.append(reinterpret_cast<const char*>(&n), sizeof(n));
}

void BSONObjBuilder::_appendTypeAndName(BSONType type, std::string_view fieldName) {
    invariant(!_done);
    invariant(fieldName.find('\0') == std::string_view::npos);
    _buf.push_back(static_cast<char>(type));
    _buf.append(fieldName.data(), fieldName.size());
    _buf.push_back('\0');
}

BSONObjBuilder& BSONObjBuilder::append(const BSONElement& e) {
    // Do not append eoo, that would corrupt us. The builder auto-appends when done() is called.
    invariant(!e.eoo());
    invariant(!_done);
    _buf.append(e.rawdata(), e.size());
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendAs(const BSONElement& e, std::string_view fieldName) {
    invariant(!e.eoo());
    _appendTypeAndName(e.type(), fieldName);
    _buf.append(e.value(), e.valuesize());
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendElements(const BSONObj& x) {
    for (auto&& elem : x) {
        append(elem);
    }
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(std::string_view fieldName, const BSONObj& subObj) {
    _appendTypeAndName(BSONType::object, fieldName);
    _buf.append(subObj.objdata(), subObj.objsize());
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(std::string_view fieldName, const BSONArray& subArray) {
    return appendArray(fieldName, subArray);
}

BSONObjBuilder& BSONObjBuilder::appendArray(std::string_view fieldName, const BSONObj& subObj) {
    _appendTypeAndName(BSONType::array, fieldName);
    _buf.append(subObj.objdata(), subObj.objsize());
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(std::string_view fieldName, bool val) {
    _appendTypeAndName(BSONType::boolean, fieldName);
    _buf.push_back(val ? 1 : 0);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(std::string_view fieldName, double n) {
    _appendTypeAndName(BSONType::numberDouble, fieldName);
    std::uint64_t bits;
    std::memcpy(&bits, &n, sizeof(bits));
    _appendInt64(static_cast<std::int64_t>(bits));
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendNumberInt(std::string_view fieldName, std::int32_t n) {
    _appendTypeAndName(BSONType::numberInt, fieldName);
    _appendInt32(n);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendNumberLong(std::string_view fieldName, std::int64_t n) {
    _appendTypeAndName(BSONType::numberLong, fieldName);
    _appendInt64(n);
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(std::string_view fieldName, const char* str) {
    return append(fieldName, std::string_view(str));
}

BSONObjBuilder& BSONObjBuilder::append(std::string_view fieldName, std::string_view str) {
    _appendTypeAndName(BSONType::string, fieldName);
    _appendInt32(static_cast<std::int32_t>(str.size() + 1));
    _buf.append(str.data(), str.size());
    _buf.push_back('\0');
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(std::string_view fieldName, const std::string& str) {
    return append(fieldName, std::string_view(str));
}

BSONObjBuilder& BSONObjBuilder::append(std::string_view fieldName, Timestamp ts) {
    _appendTypeAndName(BSONType::timestamp, fieldName);
    _appendInt64(static_cast<std::int64_t>(ts.asULL()));
    return *this;
}

BSONObjBuilder& BSONObjBuilder::append(std::string_view fieldName, Date_t dt) {
    _appendTypeAndName(BSONType::date, fieldName);
    _appendInt64(dt.toMillisSinceEpoch());
    return *this;
}

BSONObjBuilder& BSONObjBuilder::appendNull(std::string_view fieldName) {
    _appendTypeAndName(BSONType::null, fieldName);
    return *this;
}

bool BSONObjBuilder::hasField(std::string_view name) const {
    // The object is not terminated yet, so walk the elements up to the current end.
    const char* p = _buf.data() + 4;
    const char* end = _buf.data() + _buf.size();
    while (p < end) {
        BSONElement e(p);
        if (e.fieldNameStringData() == name)
            return true;
        p += e.size();
    }
    return false;
}

BSONObj BSONObjBuilder::obj() {
    invariant(!_done);
    _done = true;
    _buf.push_back('\0');
    std::int32_t size = boost::endian::native_to_little(static_cast<std::int32_t>(_buf.size()));
    std::memcpy(_buf.data(), &size, sizeof(size));
    return BSONObj::takeOwnership(std::move(_buf));
}

}  // namespace shake
