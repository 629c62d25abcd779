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

#define SHAKE_LOGV2_DEFAULT_COMPONENT ::shake::logv2::LogComponent::kReplication

#include "shake/logv2/log.h"

#include "shake/bson/bsonobjbuilder.h"
#include "shake/bson/timestamp.h"
#include "shake/db/namespace_string.h"
#include "shake/logv2/log_capture_backend.h"
#include "shake/unittest/unittest.h"

namespace shake {
namespace logv2 {
namespace {

class LogTest : public unittest::Test {
protected:
    void TearDown() override {
        setMinimumLoggedSeverity(LogComponent::kReplication, LogSeverity::Log());
    }

    LogCaptureGuard logs;
};

TEST_F(LogTest, RendersStructuredLine) {
    LOGV2(5210901, "Syncer blocked", "replSet"_attr = "rsA", "count"_attr = 3);

    auto lines = logs.getLines();
    ASSERT_EQ(1U, lines.size());
    const auto& line = lines[0];
    ASSERT_NE(std::string::npos, line.find(R"("s":"I")"));
    ASSERT_NE(std::string::npos, line.find(R"("c":"REPL")"));
    ASSERT_NE(std::string::npos, line.find(R"("id":5210901)"));
    ASSERT_NE(std::string::npos, line.find(R"("msg":"Syncer blocked")"));
    ASSERT_NE(std::string::npos, line.find(R"("attr":{"replSet":"rsA","count":3})"));
}

TEST_F(LogTest, SubstitutesNamedPlaceholders) {
    LOGV2(5210902, "Blocked at {ns}", "ns"_attr = NamespaceString("test.coll"));
    ASSERT_EQ(1, logs.countLinesContaining(R"("msg":"Blocked at test.coll")"));
}

TEST_F(LogTest, RendersBSONAndTimestampsAsJson) {
    LOGV2(5210903,
          "Released",
          "ddl"_attr = BSON("drop" << "coll"),
          "ts"_attr = Timestamp(5, 1));
    ASSERT_EQ(1,
              logs.countLinesContaining(
                  R"("attr":{"ddl":{"drop":"coll"},"ts":{"$timestamp":{"t":5,"i":1}}})"));
}

TEST_F(LogTest, EscapesStrings) {
    LOGV2(5210904, "Quoted", "value"_attr = std::string("say \"hi\""));
    ASSERT_EQ(1, logs.countLinesContaining(R"("value":"say \"hi\"")"));
}

TEST_F(LogTest, SeverityMarkers) {
    LOGV2_WARNING(5210905, "Careful");
    LOGV2_ERROR(5210906, "Broken");
    ASSERT_EQ(1, logs.countLinesContaining(R"("s":"W")"));
    ASSERT_EQ(1, logs.countLinesContaining(R"("s":"E")"));
}

TEST_F(LogTest, DebugLinesFollowComponentVerbosity) {
    LOGV2_DEBUG(5210907, 1, "Hidden");
    ASSERT_EQ(0, logs.countLinesContaining("Hidden"));

    setMinimumLoggedSeverity(LogComponent::kReplication, LogSeverity::Debug(2));
    LOGV2_DEBUG(5210908, 2, "Shown");
    LOGV2_DEBUG(5210909, 3, "Too verbose");
    ASSERT_EQ(1, logs.countLinesContaining(R"("s":"D2")"));
    ASSERT_EQ(0, logs.countLinesContaining("Too verbose"));
}

TEST_F(LogTest, ThreadNameIsContext) {
    setThreadName("DdlEliminator");
    LOGV2(5210910, "Tick");
    setThreadName("-");
    ASSERT_EQ(1, logs.countLinesContaining(R"("ctx":"DdlEliminator")"));
}

}  // namespace
}  // namespace logv2
}  // namespace shake
