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

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include "shake/bson/bsonelement.h"
#include "shake/bson/bsonobj.h"
#include "shake/bson/timestamp.h"
#include "shake/util/time_support.h"

namespace shake {

class BSONObjBuilder;

/**
 * The value half of the `builder << "name" << value` streaming syntax.
 */
class BSONObjBuilderValueStream {
public:
    BSONObjBuilderValueStream(const BSONObjBuilderValueStream&) = delete;
    BSONObjBuilderValueStream& operator=(const BSONObjBuilderValueStream&) = delete;

    explicit BSONObjBuilderValueStream(BSONObjBuilder* builder) : _builder(builder) {}

    template <typename T>
    BSONObjBuilder& operator<<(const T& value);

    BSONObjBuilder& operator<<(const BSONElement& e);

    void endField(std::string_view nextFieldName) {
        _fieldName.assign(nextFieldName);
    }

private:
    BSONObjBuilder* _builder;
    std::string _fieldName;
};

/**
 * Utility for creating a BSONObj.
 *
 *     BSONObjBuilder b;
 *     b.append("name", "joe");
 *     b.append("age", 33);
 *     BSONObj o = b.obj();
 *
 * or with the streaming syntax, see also the BSON() macro below:
 *
 *     BSONObj o = BSON("name" << "joe" << "age" << 33);
 */
class BSONObjBuilder {
public:
    explicit BSONObjBuilder(int initsize = 64);

    BSONObjBuilder(const BSONObjBuilder&) = delete;
    BSONObjBuilder& operator=(const BSONObjBuilder&) = delete;

    /** Append a BSON element, copying its field name and value. */
    BSONObjBuilder& append(const BSONElement& e);

    /** Append a BSON element under a different field name. */
    BSONObjBuilder& appendAs(const BSONElement& e, std::string_view fieldName);

    /** Add all the top level elements of 'x' to this object. */
    BSONObjBuilder& appendElements(const BSONObj& x);

    /** Append a nested object. */
    BSONObjBuilder& append(std::string_view fieldName, const BSONObj& subObj);

    /** Append a nested array. */
    BSONObjBuilder& append(std::string_view fieldName, const BSONArray& subArray);
    BSONObjBuilder& appendArray(std::string_view fieldName, const BSONObj& subObj);

    BSONObjBuilder& append(std::string_view fieldName, bool val);
    BSONObjBuilder& append(std::string_view fieldName, double n);

    /**
     * Append an integer; values that fit a signed 32 bit integer are stored as NumberInt, all
     * other integers as NumberLong.
     */
    template <typename T>
    requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
    BSONObjBuilder& append(std::string_view fieldName, T n) {
        if constexpr (sizeof(T) < 4 || (sizeof(T) == 4 && std::is_signed_v<T>)) {
            return appendNumberInt(fieldName, static_cast<std::int32_t>(n));
        } else {
            return appendNumberLong(fieldName, static_cast<std::int64_t>(n));
        }
    }

    BSONObjBuilder& appendNumberInt(std::string_view fieldName, std::int32_t n);
    BSONObjBuilder& appendNumberLong(std::string_view fieldName, std::int64_t n);

    BSONObjBuilder& append(std::string_view fieldName, const char* str);
    BSONObjBuilder& append(std::string_view fieldName, std::string_view str);
    BSONObjBuilder& append(std::string_view fieldName, const std::string& str);

    BSONObjBuilder& append(std::string_view fieldName, Timestamp ts);
    BSONObjBuilder& append(std::string_view fieldName, Date_t dt);

    BSONObjBuilder& appendNull(std::string_view fieldName);

    /** Returns true if a field named 'name' has already been appended. */
    bool hasField(std::string_view name) const;

    BSONObjBuilderValueStream& operator<<(std::string_view name) {
        _s.endField(name);
        return _s;
    }

    BSONObjBuilder& operator<<(const BSONElement& e) {
        return append(e);
    }

    /**
     * Finishes the object and returns it. The builder must not be used afterwards.
     */
    BSONObj obj();

    /** The current size of the object being built, in bytes. */
    int len() const {
        return static_cast<int>(_buf.size());
    }

private:
    void _appendTypeAndName(BSONType type, std::string_view fieldName);
    void _appendInt32(std::int32_t n);
    void _appendInt64(std::int64_t n);

    std::string _buf;
    BSONObjBuilderValueStream _s;
    bool _done = false;
};

template <typename T>
BSONObjBuilder& BSONObjBuilderValueStream::operator<<(const T& value) {
    if constexpr (std::is_array_v<T>) {
        return _builder->append(_fieldName, static_cast<const char*>(value));
    } else {
        return _builder->append(_fieldName, value);
    }
}

inline BSONObjBuilder& BSONObjBuilderValueStream::operator<<(const BSONElement& e) {
    return _builder->appendAs(e, _fieldName);
}

/**
 * Utility for creating a BSON array. Field names are generated as "0", "1", ...
 */
class BSONArrayBuilder {
public:
    template <typename T>
    BSONArrayBuilder& append(const T& value) {
        if constexpr (std::is_array_v<T>) {
            _b.append(std::to_string(_i++), static_cast<const char*>(value));
        } else {
            _b.append(std::to_string(_i++), value);
        }
        return *this;
    }

    template <typename T>
    BSONArrayBuilder& operator<<(const T& value) {
        return append(value);
    }

    BSONArray arr() {
        return BSONArray(_b.obj());
    }

private:
    BSONObjBuilder _b;
    int _i = 0;
};

/**
 * Use BSON macro to build a BSONObj from a stream
 *
 *     e.g.,
 *     BSON( "name" << "joe" << "age" << 33 )
 */
#define BSON(x) ((::shake::BSONObjBuilder(64) << x).obj())

/**
 * Use BSON_ARRAY macro like BSON macro, but without keys
 *
 *     BSONArray arr = BSON_ARRAY( "hello" << 1 << BSON( "foo" << BSON_ARRAY( "bar" << "baz" ) ) );
 */
#define BSON_ARRAY(x) ((::shake::BSONArrayBuilder() << x).arr())

}  // namespace shake
