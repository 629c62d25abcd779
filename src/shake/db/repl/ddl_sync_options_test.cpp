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

#include <limits>

#include "shake/bson/bsonobjbuilder.h"
#include "shake/unittest/unittest.h"

namespace shake {
namespace repl {
namespace {

TEST(DdlSyncOptionsTest, Defaults) {
    auto swOptions = DdlSyncOptions::parse(BSONObj());
    ASSERT_OK(swOptions);
    const auto& options = swOptions.getValue();
    ASSERT_EQ(Milliseconds(1000), options.checkInterval);
    ASSERT_EQ(Milliseconds(60000), options.unresponsiveThreshold);
    ASSERT_EQ(Milliseconds(1000), options.metadataSettleDelay);
    ASSERT_FALSE(options.targetIsSharded);
}

TEST(DdlSyncOptionsTest, ParsesEveryField) {
    auto swOptions = DdlSyncOptions::parse(BSON("checkIntervalSecs" << 2
                                                << "unresponsiveThresholdSecs" << 120LL
                                                << "metadataSettleDelaySecs" << 0
                                                << "targetIsSharded" << true));
    ASSERT_OK(swOptions);
    const auto& options = swOptions.getValue();
    ASSERT_EQ(Milliseconds(2000), options.checkInterval);
    ASSERT_EQ(Milliseconds(120000), options.unresponsiveThreshold);
    ASSERT_EQ(Milliseconds(0), options.metadataSettleDelay);
    ASSERT_TRUE(options.targetIsSharded);

    auto swReparsed = DdlSyncOptions::parse(options.toBSON());
    ASSERT_OK(swReparsed);
    ASSERT_EQ(options.unresponsiveThreshold, swReparsed.getValue().unresponsiveThreshold);
}

TEST(DdlSyncOptionsTest, RejectsUnknownField) {
    auto swOptions = DdlSyncOptions::parse(BSON("checkInterval" << 1));
    ASSERT_EQ(ErrorCodes::BadValue, swOptions.getStatus().code());
}

TEST(DdlSyncOptionsTest, RejectsNonPositiveIntervals) {
    ASSERT_EQ(ErrorCodes::BadValue,
              DdlSyncOptions::parse(BSON("checkIntervalSecs" << 0)).getStatus().code());
    ASSERT_EQ(ErrorCodes::BadValue,
              DdlSyncOptions::parse(BSON("unresponsiveThresholdSecs" << -5)).getStatus().code());
    ASSERT_EQ(ErrorCodes::BadValue,
              DdlSyncOptions::parse(BSON("metadataSettleDelaySecs" << -1)).getStatus().code());
}

TEST(DdlSyncOptionsTest, RejectsIntervalsThatDoNotFitInMilliseconds) {
    ASSERT_EQ(ErrorCodes::BadValue,
              DdlSyncOptions::parse(BSON("unresponsiveThresholdSecs"
                                         << std::numeric_limits<long long>::max()))
                  .getStatus()
                  .code());
    ASSERT_EQ(ErrorCodes::BadValue,
              DdlSyncOptions::parse(BSON("checkIntervalSecs" << 1e30)).getStatus().code());
    ASSERT_EQ(ErrorCodes::BadValue,
              DdlSyncOptions::parse(BSON("unresponsiveThresholdSecs"
                                         << std::numeric_limits<double>::infinity()))
                  .getStatus()
                  .code());
    ASSERT_EQ(ErrorCodes::BadValue,
              DdlSyncOptions::parse(BSON("metadataSettleDelaySecs"
                                         << std::numeric_limits<double>::quiet_NaN()))
                  .getStatus()
                  .code());
    ASSERT_EQ(ErrorCodes::BadValue,
              DdlSyncOptions::parse(BSON("unresponsiveThresholdSecs"
                                         << DdlSyncOptions::kMaxSeconds + 1))
                  .getStatus()
                  .code());
}

TEST(DdlSyncOptionsTest, AcceptsLargestInterval) {
    auto swOptions =
        DdlSyncOptions::parse(BSON("unresponsiveThresholdSecs" << DdlSyncOptions::kMaxSeconds));
    ASSERT_OK(swOptions);
    ASSERT_EQ(Milliseconds(DdlSyncOptions::kMaxSeconds * 1000),
              swOptions.getValue().unresponsiveThreshold);
}

TEST(DdlSyncOptionsTest, RejectsWrongTypes) {
    ASSERT_EQ(ErrorCodes::TypeMismatch,
              DdlSyncOptions::parse(BSON("checkIntervalSecs" << "1")).getStatus().code());
    ASSERT_EQ(ErrorCodes::TypeMismatch,
              DdlSyncOptions::parse(BSON("targetIsSharded" << 1)).getStatus().code());
}

}  // namespace
}  // namespace repl
}  // namespace shake
