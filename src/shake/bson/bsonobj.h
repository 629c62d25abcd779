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
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "shake/base/status.h"
#include "shake/bson/bsonelement.h"
#include "shake/bson/bsontypes.h"

namespace shake {

class BSONObjStlIterator;

/**
 * C++ representation of a "BSON" object -- that is, an extended JSON-style object in a binary
 * representation.
 *
 * Note that BSONObj's have a smart pointer capability built in -- so you can pass them around
 * by value. The reference counts used to implement this do not use locking, so copying and
 * destroying BSONObj's are not thread-safe operations.
 *
 * BSON object format:
 *
 *     code
 *     <unsigned totalSize> {<byte BSONType><cstring FieldName><Data>}* EOO
 *
 *     totalSize includes itself.
 *
 * Data:
 *     Bool:      <byte>
 *     EOO:       nothing follows
 *     Undefined: nothing follows
 *     OID:       an OID object
 *     NumberDouble: <double>
 *     NumberInt: <int32>
 *     NumberLong: <int64>
 *     String:    <unsigned32 strsizewithnull><cstring>
 *     Date:      <8bytes>
 *     Timestamp: <unsigned32 inc><unsigned32 secs>
 *     Object:    a nested object, leading with its entire size, which terminates with EOO.
 *     Array:     same as object
 */
class BSONObj {
public:
    using iterator = BSONObjStlIterator;

    /** Construct an empty BSONObj -- that is, {}. */
    BSONObj();

    /**
     * Constructs a BSONObj that views 'bsonData' without owning it. 'bsonData' must hold a
     * well formed object and outlive this BSONObj and any copies of it; call getOwned() to detach.
     */
    explicit BSONObj(const char* bsonData) : _objdata(bsonData) {}

    /**
     * Constructs a BSONObj that owns 'buffer', which must hold exactly one well formed object.
     * Use validateBSON() first when the bytes come from outside this process.
     */
    static BSONObj takeOwnership(std::string buffer);

    /**
     * A BSONObj can use a buffer it "owns" or one it does not.
     *
     * OWNED CASE
     * If the BSONObj owns the buffer, the buffer can be shared among several BSONObj's (by
     * assignment). In this case the buffer is basically implemented as a shared_ptr.
     *
     * UNOWNED CASE
     * A BSONObj can also point to BSON data in some other data structure it does not "own" or
     * free later. For example, in a memory mapped file. In this case, it is important the
     * original data stays in scope for as long as the BSONObj is in use.
     */
    bool isOwned() const {
        return static_cast<bool>(_holder);
    }

    /**
     * Returns an owned copy of the object, or the object itself if it is already owned.
     */
    BSONObj getOwned() const;

    const char* objdata() const {
        return _objdata;
    }

    /** Returns the total size of the BSONObj in bytes. */
    int objsize() const {
        return bson_detail::readLE<std::int32_t>(_objdata);
    }

    bool isEmpty() const {
        return objsize() <= 5;
    }

    /** Returns the number of top level fields in the object. */
    int nFields() const;

    /** Returns the object's bytes. Two objects are "the same" iff these bytes are equal. */
    std::string toBuffer() const {
        return std::string(_objdata, objsize());
    }

    /**
     * Get the field of the specified name. eoo() is true on the returned element if not found.
     */
    BSONElement getField(std::string_view name) const;

    BSONElement operator[](std::string_view field) const {
        return getField(field);
    }

    bool hasField(std::string_view name) const {
        return !getField(name).eoo();
    }

    /** @return "" if not found or not a string. */
    std::string_view getStringField(std::string_view name) const;

    /** @return the embedded object, or {} if not found or not an object. */
    BSONObj getObjectField(std::string_view name) const;

    /** @return false if not found or not truthy. */
    bool getBoolField(std::string_view name) const;

    BSONElement firstElement() const {
        return BSONElement(objdata() + 4);
    }

    const char* firstElementFieldName() const {
        return firstElement().fieldName();
    }

    std::string_view firstElementFieldNameStringData() const {
        return firstElement().fieldNameStringData();
    }

    /** Returns true if the two objects have identical bytes. */
    bool binaryEqual(const BSONObj& r) const;

    /**
     * Returns a copy of this object with the top level field 'name' removed.
     */
    BSONObj removeField(std::string_view name) const;

    /** Renders in the shell style, e.g. { a: 1, b: "x" }. */
    std::string toString() const;

    /** Renders as relaxed extended JSON, e.g. {"a":1,"b":"x"}. */
    std::string jsonString() const;

    iterator begin() const;
    iterator end() const;

private:
    std::shared_ptr<const std::string> _holder;
    const char* _objdata;
};

std::ostream& operator<<(std::ostream& s, const BSONObj& o);

/**
 * A BSONObj known to hold an array, i.e. its field names are "0", "1", ...
 */
struct BSONArray : BSONObj {
    BSONArray() = default;
    explicit BSONArray(const BSONObj& obj) : BSONObj(obj) {}
};

/**
 * Iterator over the elements of a BSONObj, for use in range-based for loops.
 */
class BSONObjStlIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = const BSONElement;
    using pointer = const BSONElement*;
    using reference = const BSONElement&;

    BSONObjStlIterator() = default;

    explicit BSONObjStlIterator(const BSONElement& elem) : _cur(elem) {}

    static BSONObjStlIterator endOf(const BSONObj& obj) {
        BSONObjStlIterator out;
        out._cur = BSONElement(obj.objdata() + obj.objsize() - 1);
        return out;
    }

    reference operator*() const {
        return _cur;
    }

    pointer operator->() const {
        return &_cur;
    }

    BSONObjStlIterator& operator++() {
        _cur = BSONElement(_cur.rawdata() + _cur.size());
        return *this;
    }

    BSONObjStlIterator operator++(int) {
        BSONObjStlIterator oldPos = *this;
        ++*this;
        return oldPos;
    }

    friend bool operator==(const BSONObjStlIterator& lhs, const BSONObjStlIterator& rhs) {
        return lhs._cur.rawdata() == rhs._cur.rawdata();
    }

    friend bool operator!=(const BSONObjStlIterator& lhs, const BSONObjStlIterator& rhs) {
        return !(lhs == rhs);
    }

private:
    BSONElement _cur;
};

inline BSONObj::iterator BSONObj::begin() const {
    return BSONObjStlIterator(firstElement());
}

inline BSONObj::iterator BSONObj::end() const {
    return BSONObjStlIterator::endOf(*this);
}

/**
 * Java-style iterator over the elements of a BSONObj.
 *
 *     BSONObjIterator i(obj);
 *     while (i.more()) {
 *         BSONElement e = i.next();
 *         ...
 *     }
 */
class BSONObjIterator {
public:
    explicit BSONObjIterator(const BSONObj& obj) : _cur(obj.begin()), _end(obj.end()) {}

    bool more() const {
        return _cur != _end;
    }

    BSONElement next() {
        return *_cur++;
    }

private:
    BSONObjStlIterator _cur;
    BSONObjStlIterator _end;
};

}  // namespace shake
