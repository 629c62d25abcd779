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

#include <limits>
#include <string_view>

#include "shake/base/status_with.h"
#include "shake/bson/bsonobj.h"
#include "shake/util/duration.h"

namespace shake {
namespace repl {

/**
 * Tunables of the DDL barrier, parsed from the 'ddl' section of the pipeline configuration:
 *
 *     {
 *         checkIntervalSecs: <int>,          // period of the elimination loop, default 1
 *         unresponsiveThresholdSecs: <int>,  // idle time after which a source is passed over,
 *                                            // default 60
 *         metadataSettleDelaySecs: <int>,    // pause before reading sharding metadata, default 1;
 *                                            // 0 disables it
 *         targetIsSharded: <bool>            // default false
 *     }
 */
struct DdlSyncOptions {
    static constexpr std::string_view kCheckIntervalFieldName = "checkIntervalSecs";
    static constexpr std::string_view kUnresponsiveThresholdFieldName =
        "unresponsiveThresholdSecs";
    static constexpr std::string_view kMetadataSettleDelayFieldName = "metadataSettleDelaySecs";
    static constexpr std::string_view kTargetIsShardedFieldName = "targetIsSharded";

    // Upper bound of every *Secs field.
    static constexpr long long kMaxSeconds = std::numeric_limits<int>::max();

    /**
     * Parses 'doc'. Missing fields keep their defaults; unknown fields, non-finite values and
     * values above kMaxSeconds are rejected.
     */
    static StatusWith<DdlSyncOptions> parse(const BSONObj& doc);

    BSONObj toBSON() const;

    Milliseconds checkInterval{Seconds(1)};
    Milliseconds unresponsiveThreshold{Seconds(60)};
    Milliseconds metadataSettleDelay{Seconds(1)};
    bool targetIsSharded = false;
};

}  // namespace repl
}  // namespace shake
