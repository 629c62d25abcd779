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

#include "shake/base/error_codes.h"

#include <ostream>

#include "shake/util/str.h"

namespace shake {

namespace {

struct ErrorCodeName {
    ErrorCodes::Error code;
    const char* name;
};

constexpr ErrorCodeName kErrorCodeNames[] = {
    {ErrorCodes::OK, "OK"},
    {ErrorCodes::InternalError, "InternalError"},
    {ErrorCodes::BadValue, "BadValue"},
    {ErrorCodes::NoSuchKey, "NoSuchKey"},
    {ErrorCodes::UnknownError, "UnknownError"},
    {ErrorCodes::FailedToParse, "FailedToParse"},
    {ErrorCodes::TypeMismatch, "TypeMismatch"},
    {ErrorCodes::IllegalOperation, "IllegalOperation"},
    {ErrorCodes::InvalidBSON, "InvalidBSON"},
    {ErrorCodes::InvalidNamespace, "InvalidNamespace"},
    {ErrorCodes::ShutdownInProgress, "ShutdownInProgress"},
    {ErrorCodes::DdlNotRegistered, "DdlNotRegistered"},
    {ErrorCodes::IllegalDdlOperation, "IllegalDdlOperation"},
    {ErrorCodes::UnsupportedDdlOperation, "UnsupportedDdlOperation"},
    {ErrorCodes::ShardingMetadataNotFound, "ShardingMetadataNotFound"},
};

}  // namespace

std::string ErrorCodes::errorString(Error err) {
    for (const auto& entry : kErrorCodeNames) {
        if (entry.code == err)
            return entry.name;
    }
    return str::stream() << "Location" << static_cast<int>(err);
}

ErrorCodes::Error ErrorCodes::fromString(const std::string& name) {
    for (const auto& entry : kErrorCodeNames) {
        if (name == entry.name)
            return entry.code;
    }
    return UnknownError;
}

std::ostream& operator<<(std::ostream& stream, ErrorCodes::Error code) {
    return stream << ErrorCodes::errorString(code);
}

}  // namespace shake
