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

#include "shake/bson/bson_validate.h"

#include <cstring>

#include "shake/base/status_with.h"
#include "shake/bson/bsonelement.h"
#include "shake/util/str.h"

namespace shake {

namespace {

class Validator {
public:
    Validator(const char* data, std::uint64_t length) : _data(data), _end(data + length) {}

    Status validateObject(const char* p, int depth, bool isArray) {
        if (depth > kMaxBSONDepth)
            return _error(p, "BSON nesting depth exceeds the maximum");
        if (_end - p < 5)
            return _error(p, "object is too small to hold a size and terminator");

        auto size = bson_detail::readLE<std::int32_t>(p);
        if (size < 5 || size > _end - p)
            return _error(p, str::stream() << "declared object size " << size << " is invalid");

        const char* objEnd = p + size;
        if (objEnd[-1] != '\0')
            return _error(objEnd - 1, "object is not terminated by EOO");

        const char* cur = p + 4;
        int index = 0;
        while (cur < objEnd - 1) {
            int type = static_cast<signed char>(*cur);
            if (type == 0)
                return _error(cur, "EOO found before the end of the object");
            if (!isValidBSONType(type))
                return _error(cur, str::stream() << "unknown BSON type " << type);

            const char* name = cur + 1;
            auto nameLen = _strnlen(name, objEnd - 1);
            if (nameLen < 0)
                return _error(name, "field name is not NUL terminated");
            if (isArray && std::string_view(name, nameLen) != std::to_string(index))
                return _error(name, "array field names must be sequential indexes");

            const char* value = name + nameLen + 1;
            auto valueSize = _valueSize(static_cast<BSONType>(type), value, objEnd - 1, depth);
            if (!valueSize.isOK())
                return valueSize.getStatus();

            cur = value + valueSize.getValue();
            ++index;
        }
        if (cur != objEnd - 1)
            return _error(cur, "element overruns the enclosing object");
        return Status::OK();
    }

private:
    StatusWith<std::int64_t> _valueSize(BSONType type,
                                        const char* value,
                                        const char* limit,
                                        int depth) {
        auto fixed = [&](std::int64_t n) -> StatusWith<std::int64_t> {
            if (limit - value < n)
                return _error(value, "value overruns the enclosing object");
            return n;
        };

        switch (type) {
            case BSONType::undefined:
            case BSONType::null:
            case BSONType::minKey:
            case BSONType::maxKey:
                return 0;
            case BSONType::boolean: {
                auto r = fixed(1);
                if (r.isOK() && *value != 0 && *value != 1)
                    return _error(value, "boolean value must be 0 or 1");
                return r;
            }
            case BSONType::numberInt:
                return fixed(4);
            case BSONType::numberDouble:
            case BSONType::date:
            case BSONType::timestamp:
            case BSONType::numberLong:
                return fixed(8);
            case BSONType::oid:
                return fixed(12);
            case BSONType::numberDecimal:
                return fixed(16);
            case BSONType::string: {
                if (limit - value < 4)
                    return _error(value, "string length overruns the enclosing object");
                auto len = bson_detail::readLE<std::int32_t>(value);
                if (len < 1 || len > limit - value - 4)
                    return _error(value, str::stream() << "invalid string length " << len);
                if (value[4 + len - 1] != '\0')
                    return _error(value, "string is not NUL terminated");
                return 4 + static_cast<std::int64_t>(len);
            }
            case BSONType::object:
            case BSONType::array: {
                if (limit - value < 5)
                    return _error(value, "embedded object overruns the enclosing object");
                auto size = bson_detail::readLE<std::int32_t>(value);
                if (size < 5 || size > limit - value)
                    return _error(value, "embedded object overruns the enclosing object");
                auto status = validateObject(value, depth + 1, type == BSONType::array);
                if (!status.isOK())
                    return status;
                return size;
            }
            case BSONType::binData: {
                if (limit - value < 5)
                    return _error(value, "binary length overruns the enclosing object");
                auto len = bson_detail::readLE<std::int32_t>(value);
                if (len < 0 || len > limit - value - 5)
                    return _error(value, str::stream() << "invalid binary length " << len);
                return 5 + static_cast<std::int64_t>(len);
            }
            case BSONType::regEx: {
                auto patternLen = _strnlen(value, limit);
                if (patternLen < 0)
                    return _error(value, "regex pattern is not NUL terminated");
                auto flagsLen = _strnlen(value + patternLen + 1, limit);
                if (flagsLen < 0)
                    return _error(value, "regex flags are not NUL terminated");
                return patternLen + 1 + flagsLen + 1;
            }
            case BSONType::eoo:
                break;
        }
        return _error(value, "unexpected type");
    }

    static std::int64_t _strnlen(const char* p, const char* limit) {
        if (p >= limit)
            return -1;
        auto found = static_cast<const char*>(std::memchr(p, '\0', limit - p));
        return found ? found - p : -1;
    }

    Status _error(const char* at, const std::string& reason) const {
        return Status(ErrorCodes::InvalidBSON,
                      str::stream() << reason << " at offset " << (at - _data));
    }

    const char* _data;
    const char* _end;
};

}  // namespace

Status validateBSON(const char* buf, std::uint64_t length) {
    if (length < 5)
        return Status(ErrorCodes::InvalidBSON, "BSON data has to be at least 5 bytes");

    Validator validator(buf, length);
    auto status = validator.validateObject(buf, 0, false);
    if (!status.isOK())
        return status;

    auto size = bson_detail::readLE<std::int32_t>(buf);
    if (static_cast<std::uint64_t>(size) != length)
        return Status(ErrorCodes::InvalidBSON,
                      str::stream() << "declared object size " << size
                                    << " does not match the buffer length " << length);
    return Status::OK();
}

}  // namespace shake
