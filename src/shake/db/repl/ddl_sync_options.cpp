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

#include "shake/db/repl/ddl_sync_options.h"

#include <cmath>

#include "shake/bson/bsonobjbuilder.h"
#include "shake/util/str.h"

namespace shake {
namespace repl {

namespace {

StatusWith<Milliseconds> parseSeconds(const BSONElement& elem, bool allowZero) {
    if (!elem.isNumber())
        return Status(ErrorCodes::TypeMismatch,
                      str::stream() << "'" << elem.fieldNameStringData()
                                    << "' must be a number, found " << typeName(elem.type()));
    if (elem.type() == BSONType::numberDouble && !std::isfinite(elem.numberDouble()))
        return Status(ErrorCodes::BadValue,
                      str::stream() << "'" << elem.fieldNameStringData()
                                    << "' must be finite, found " << elem.toString(false));

    const long long secs = elem.safeNumberLong();
    if (secs < 0 || (secs == 0 && !allowZero))
        return Status(ErrorCodes::BadValue,
                      str::stream() << "'" << elem.fieldNameStringData() << "' must be "
                                    << (allowZero ? "non-negative" : "positive") << ", found "
                                    << elem.toString(false));
    if (secs > DdlSyncOptions::kMaxSeconds)
        return Status(ErrorCodes::BadValue,
                      str::stream() << "'" << elem.fieldNameStringData() << "' must be at most "
                                    << DdlSyncOptions::kMaxSeconds << ", found "
                                    << elem.toString(false));
    return Milliseconds(Seconds(secs));
}

}  // namespace

StatusWith<DdlSyncOptions> DdlSyncOptions::parse(const BSONObj& doc) {
    DdlSyncOptions options;
    for (auto&& elem : doc) {
        const auto name = elem.fieldNameStringData();
        if (name == kCheckIntervalFieldName) {
            auto swInterval = parseSeconds(elem, false);
            if (!swInterval.isOK())
                return swInterval.getStatus();
            options.checkInterval = swInterval.getValue();
        } else if (name == kUnresponsiveThresholdFieldName) {
            auto swThreshold = parseSeconds(elem, false);
            if (!swThreshold.isOK())
                return swThreshold.getStatus();
            options.unresponsiveThreshold = swThreshold.getValue();
        } else if (name == kMetadataSettleDelayFieldName) {
            auto swDelay = parseSeconds(elem, true);
            if (!swDelay.isOK())
                return swDelay.getStatus();
            options.metadataSettleDelay = swDelay.getValue();
        } else if (name == kTargetIsShardedFieldName) {
            if (elem.type() != BSONType::boolean)
                return Status(ErrorCodes::TypeMismatch,
                              str::stream() << "'" << name << "' must be a boolean, found "
                                            << typeName(elem.type()));
            options.targetIsSharded = elem.boolean();
        } else {
            return Status(ErrorCodes::BadValue,
                          str::stream() << "unrecognized DDL option '" << name << "'");
        }
    }
    return options;
}

BSONObj DdlSyncOptions::toBSON() const {
    BSONObjBuilder b;
    b.append(kCheckIntervalFieldName,
             std::chrono::duration_cast<Seconds>(checkInterval).count());
    b.append(kUnresponsiveThresholdFieldName,
             std::chrono::duration_cast<Seconds>(unresponsiveThreshold).count());
    b.append(kMetadataSettleDelayFieldName,
             std::chrono::duration_cast<Seconds>(metadataSettleDelay).count());
    b.append(kTargetIsShardedFieldName, targetIsSharded);
    return b.obj();
}

}  // namespace repl
}  // namespace shake
