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

#include "shake/bson/bsonelement.h"

#include <cmath>
#include <limits>

#include <fmt/format.h>

#include "shake/bson/bsonobj.h"
#include "shake/util/assert_util.h"
#include "shake/util/str.h"

namespace shake {

namespace {

const char kEooElement[] = {0};

/**
 * Size of the value that starts at 'value' for an element of 'type'. The element must come from
 * a well formed object.
 */
int computeValueSize(BSONType type, const char* value) {
    switch (type) {
        case BSONType::eoo:
        case BSONType::undefined:
        case BSONType::null:
        case BSONType::minKey:
        case BSONType::maxKey:
            return 0;
        case BSONType::boolean:
            return 1;
        case BSONType::numberInt:
            return 4;
        case BSONType::numberDouble:
        case BSONType::date:
        case BSONType::timestamp:
        case BSONType::numberLong:
            return 8;
        case BSONType::oid:
            return 12;
        case BSONType::numberDecimal:
            return 16;
        case BSONType::string:
            return 4 + bson_detail::readLE<std::int32_t>(value);
        case BSONType::object:
        case BSONType::array:
            return bson_detail::readLE<std::int32_t>(value);
        case BSONType::binData:
            return 4 + 1 + bson_detail::readLE<std::int32_t>(value);
        case BSONType::regEx: {
            auto patternSize = std::strlen(value) + 1;
            auto flagsSize = std::strlen(value + patternSize) + 1;
            return static_cast<int>(patternSize + flagsSize);
        }
    }
    invariant(!"unexpected BSON type in well formed object");
    return 0;
}

}  // namespace

BSONElement::BSONElement() : BSONElement(kEooElement) {}

BSONElement::BSONElement(const char* d) : _data(d) {
    if (eoo()) {
        _fieldNameSize = 0;
        _totalSize = 1;
        return;
    }
    _fieldNameSize = static_cast<int>(std::strlen(d + 1)) + 1;
    _totalSize = 1 + _fieldNameSize + computeValueSize(type(), value());
}

BSONObj BSONElement::embeddedObject() const {
    if (!isABSONObj())
        return BSONObj();
    return BSONObj(value());
}

BSONObj BSONElement::Obj() const {
    return embeddedObject();
}

bool BSONElement::trueValue() const {
    switch (type()) {
        case BSONType::numberLong:
            return numberLong() != 0;
        case BSONType::numberDouble:
            return numberDouble() != 0;
        case BSONType::numberInt:
            return numberInt() != 0;
        case BSONType::boolean:
            return boolean();
        case BSONType::eoo:
        case BSONType::null:
        case BSONType::undefined:
            return false;
        default:
            return true;
    }
}

int BSONElement::numberInt() const {
    switch (type()) {
        case BSONType::numberDouble:
            return static_cast<int>(numberDouble());
        case BSONType::numberInt:
            return bson_detail::readLE<std::int32_t>(value());
        case BSONType::numberLong:
            return static_cast<int>(numberLong());
        default:
            return 0;
    }
}

long long BSONElement::numberLong() const {
    switch (type()) {
        case BSONType::numberDouble:
            return static_cast<long long>(numberDouble());
        case BSONType::numberInt:
            return bson_detail::readLE<std::int32_t>(value());
        case BSONType::numberLong:
            return bson_detail::readLE<std::int64_t>(value());
        default:
            return 0;
    }
}

long long BSONElement::safeNumberLong() const {
    if (type() != BSONType::numberDouble)
        return numberLong();

    const double d = numberDouble();
    if (std::isnan(d))
        return 0;
    // 2^63, the smallest double that does not fit in a long long.
    if (!(d < 9223372036854775808.0))
        return std::numeric_limits<long long>::max();
    if (d < static_cast<double>(std::numeric_limits<long long>::min()))
        return std::numeric_limits<long long>::min();
    return numberLong();
}

double BSONElement::numberDouble() const {
    switch (type()) {
        case BSONType::numberDouble: {
            std::uint64_t bits = bson_detail::readLE<std::uint64_t>(value());
            double d;
            std::memcpy(&d, &bits, sizeof(d));
            return d;
        }
        case BSONType::numberInt:
        case BSONType::numberLong:
            return static_cast<double>(numberLong());
        default:
            return 0;
    }
}

Timestamp BSONElement::timestamp() const {
    if (type() != BSONType::timestamp && type() != BSONType::date)
        return Timestamp();
    return Timestamp(bson_detail::readLE<std::uint64_t>(value()));
}

Date_t BSONElement::date() const {
    if (type() != BSONType::date)
        return Date_t();
    return Date_t::fromMillisSinceEpoch(bson_detail::readLE<std::int64_t>(value()));
}

bool BSONElement::binaryEqualValues(const BSONElement& rhs) const {
    if (type() != rhs.type())
        return false;
    if (valuesize() != rhs.valuesize())
        return false;
    return std::memcmp(value(), rhs.value(), valuesize()) == 0;
}

std::string BSONElement::toString(bool includeFieldName) const {
    std::string out;
    if (includeFieldName && !eoo()) {
        out += fieldName();
        out += ": ";
    }
    switch (type()) {
        case BSONType::eoo:
            out += "EOO";
            break;
        case BSONType::numberDouble:
            out += fmt::format("{}", numberDouble());
            break;
        case BSONType::string:
            out += "\"" + std::string(valueStringData()) + "\"";
            break;
        case BSONType::object:
            out += embeddedObject().toString();
            break;
        case BSONType::array: {
            std::string items;
            for (auto&& item : embeddedObject()) {
                items += items.empty() ? "[ " : ", ";
                items += item.toString(false);
            }
            out += items.empty() ? "[]" : items + " ]";
            break;
        }
        case BSONType::boolean:
            out += boolean() ? "true" : "false";
            break;
        case BSONType::date:
            out += "new Date(" + std::to_string(date().toMillisSinceEpoch()) + ")";
            break;
        case BSONType::null:
            out += "null";
            break;
        case BSONType::undefined:
            out += "undefined";
            break;
        case BSONType::numberInt:
            out += std::to_string(numberInt());
            break;
        case BSONType::numberLong:
            out += std::to_string(numberLong()) + "LL";
            break;
        case BSONType::timestamp:
            out += timestamp().toString();
            break;
        case BSONType::minKey:
            out += "MinKey";
            break;
        case BSONType::maxKey:
            out += "MaxKey";
            break;
        default:
            out += fmt::format("<{}>", typeName(type()));
            break;
    }
    return out;
}

std::string BSONElement::jsonString(bool includeFieldName) const {
    std::string out;
    if (includeFieldName)
        out += "\"" + str::escape(fieldNameStringData()) + "\":";
    switch (type()) {
        case BSONType::numberDouble: {
            double d = numberDouble();
            if (std::isfinite(d)) {
                out += fmt::format("{}", d);
            } else {
                out += fmt::format(R"({{"$numberDouble":"{}"}})", d);
            }
            break;
        }
        case BSONType::string:
            out += "\"" + str::escape(valueStringData()) + "\"";
            break;
        case BSONType::object:
            out += embeddedObject().jsonString();
            break;
        case BSONType::array: {
            out += "[";
            bool first = true;
            for (auto&& item : embeddedObject()) {
                if (!first)
                    out += ",";
                out += item.jsonString(false);
                first = false;
            }
            out += "]";
            break;
        }
        case BSONType::boolean:
            out += boolean() ? "true" : "false";
            break;
        case BSONType::date:
            out += fmt::format(R"({{"$date":"{}"}})", date().toString());
            break;
        case BSONType::numberInt:
        case BSONType::numberLong:
            out += std::to_string(numberLong());
            break;
        case BSONType::timestamp:
            out += timestamp().jsonString();
            break;
        case BSONType::minKey:
            out += R"({"$minKey":1})";
            break;
        case BSONType::maxKey:
            out += R"({"$maxKey":1})";
            break;
        case BSONType::eoo:
        case BSONType::null:
        case BSONType::undefined:
            out += "null";
            break;
        default:
            out += fmt::format(R"({{"$type":"{}"}})", typeName(type()));
            break;
    }
    return out;
}

}  // namespace shake
