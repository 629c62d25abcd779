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
#include <cstring>
#include <string>
#include <string_view>

#include <boost/endian/conversion.hpp>

#include "shake/bson/bsontypes.h"
#include "shake/bson/timestamp.h"
#include "shake/util/time_support.h"

namespace shake {

namespace bson_detail {

template <typename T>
T readLE(const char* p) {
    T value;
    std::memcpy(&value, p, sizeof(T));
    return boost::endian::little_to_native(value);
}

}  // namespace bson_detail

/**
 * BSONElement represents an "element" in a BSONObj. So for the object { a : 3, b : "abc" },
 * 'a : 3' is the first element (key+value).
 *
 * The BSONElement object points into the BSONObj's data. Thus the BSONObj must stay in scope
 * for the life of the BSONElement.
 *
 * internals:
 *     <type><fieldName    ><value>
 *     -------- size() ------------
 *     -fieldNameSize-
 *     value()
 *     type()
 */
class BSONElement {
public:
    /** Construct a BSONElement for the "end of object" marker. */
    BSONElement();

    /**
     * Constructs an element over 'd', which must point at the type byte of a well formed element.
     */
    explicit BSONElement(const char* d);

    BSONType type() const {
        return static_cast<BSONType>(static_cast<signed char>(*_data));
    }

    /**
     * Indicates if it is the end-of-object element, which is present at the end of every BSON
     * object.
     */
    bool eoo() const {
        return type() == BSONType::eoo;
    }

    /** Size of the element, including its type byte and field name. */
    int size() const {
        return _totalSize;
    }

    const char* fieldName() const {
        if (eoo())
            return "";  // no fieldname for it.
        return _data + 1;
    }

    std::string_view fieldNameStringData() const {
        return eoo() ? std::string_view() : std::string_view(fieldName(), _fieldNameSize - 1);
    }

    /** Raw data of the element's value (so be careful). */
    const char* value() const {
        return _data + _fieldNameSize + 1;
    }

    /** Size in bytes of the element's value (when applicable). */
    int valuesize() const {
        return _totalSize - _fieldNameSize - 1;
    }

    bool isABSONObj() const {
        return type() == BSONType::object || type() == BSONType::array;
    }

    bool isNumber() const {
        return isNumericBSONType(type());
    }

    /** Raw data of the element, starting at the type byte. */
    const char* rawdata() const {
        return _data;
    }

    /**
     * The value of a string element without the trailing NUL. Only valid when type() is string.
     */
    std::string_view valueStringData() const {
        return std::string_view(value() + 4, bson_detail::readLE<std::int32_t>(value()) - 1);
    }

    /** The value of a string element, or the empty string for any other type. */
    std::string_view valueStringDataSafe() const {
        return type() == BSONType::string ? valueStringData() : std::string_view();
    }

    std::string str() const {
        return std::string(valueStringDataSafe());
    }

    /**
     * Get the embedded object or array for this element. Returns an empty object for any other
     * type. The returned object does not own its buffer and shares the lifetime of this element.
     */
    BSONObj embeddedObject() const;

    BSONObj Obj() const;

    bool boolean() const {
        return *value() ? true : false;
    }

    /**
     * Returns true for true booleans and non-zero numbers, false for everything that is falsy
     * (false, null, undefined, zero, eoo).
     */
    bool trueValue() const;

    /** Returns the numeric value as an int, truncating doubles and narrowing longs. */
    int numberInt() const;

    long long numberLong() const;

    /**
     * Like numberLong() but with well-defined behavior for doubles that are NaNs, or too
     * large/small to be represented as long longs.
     * NaNs -> 0
     * very large doubles -> LLONG_MAX
     * very small doubles -> LLONG_MIN
     */
    long long safeNumberLong() const;

    double numberDouble() const;

    Timestamp timestamp() const;

    Date_t date() const;

    /** Returns true if the two elements have identical bytes, field names included. */
    bool binaryEqual(const BSONElement& rhs) const {
        return _totalSize == rhs._totalSize && std::memcmp(_data, rhs._data, _totalSize) == 0;
    }

    /**
     * Returns true if the two elements have identical bytes, ignoring field names.
     */
    bool binaryEqualValues(const BSONElement& rhs) const;

    /** Renders as "name: value", or just "value" when includeFieldName is false. */
    std::string toString(bool includeFieldName = true) const;

    /** Renders as the relaxed extended JSON "\"name\":value" pair or just the value. */
    std::string jsonString(bool includeFieldName = true) const;

private:
    const char* _data;
    int _fieldNameSize;  // Includes the trailing NUL.
    int _totalSize;
};

}  // namespace shake
