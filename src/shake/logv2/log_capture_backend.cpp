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

#include "shake/logv2/log_capture_backend.h"

#include <algorithm>

#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/make_shared.hpp>

#include "shake/logv2/log_manager.h"

namespace shake {
namespace logv2 {

void LogCaptureBackend::consume(const boost::log::record_view& rec) {
    if (auto message = boost::log::extract<std::string>("Message", rec)) {
        std::lock_guard<std::mutex> lk(_mutex);
        _lines.push_back(*message);
    }
}

std::vector<std::string> LogCaptureBackend::getLines() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _lines;
}

void LogCaptureBackend::clear() {
    std::lock_guard<std::mutex> lk(_mutex);
    _lines.clear();
}

LogCaptureGuard::LogCaptureGuard()
    : _backend(boost::make_shared<LogCaptureBackend>()),
      _sink(boost::make_shared<Sink>(_backend)) {
    // Make sure the console sink is attached before ours so both see every record.
    LogManager::global();
    boost::log::core::get()->add_sink(_sink);
}

LogCaptureGuard::~LogCaptureGuard() {
    boost::log::core::get()->remove_sink(_sink);
    _sink->flush();
}

int LogCaptureGuard::countLinesContaining(const std::string& needle) const {
    auto lines = getLines();
    return std::count_if(lines.begin(), lines.end(), [&](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

}  // namespace logv2
}  // namespace shake
