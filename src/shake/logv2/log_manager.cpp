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

#include "shake/logv2/log_manager.h"

#include <chrono>
#include <iostream>
#include <iterator>
#include <thread>

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <fmt/args.h>
#include <fmt/format.h>

#include "shake/logv2/log.h"
#include "shake/util/time_support.h"

namespace shake {
namespace logv2 {

namespace {

thread_local std::string threadName = "-";

void addConsoleSink() {
    using ConsoleSink =
        boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);

    auto sink = boost::make_shared<ConsoleSink>(backend);
    sink->set_formatter(boost::log::expressions::stream << boost::log::expressions::smessage);
    boost::log::core::get()->add_sink(sink);
}

std::string formatMessage(const char* message,
                          std::initializer_list<detail::NamedAttribute> attrs) {
    if (attrs.size() == 0)
        return message;

    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const auto& attr : attrs) {
        store.push_back(fmt::arg(attr.name, attr.text));
    }
    try {
        return fmt::vformat(message, store);
    } catch (const fmt::format_error&) {
        // A message that is not a valid replacement-field string is logged verbatim.
        return message;
    }
}

}  // namespace

LogManager::LogManager() {
    for (auto& severity : _minimumSeverity) {
        severity.store(LogSeverity::Log().toInt());
    }
    addConsoleSink();
}

LogManager& LogManager::global() {
    static LogManager* globalLogManager = new LogManager();
    return *globalLogManager;
}

bool LogManager::shouldLog(LogComponent component, LogSeverity severity) const {
    return severity.toInt() <= _minimumSeverity[component].load(std::memory_order_relaxed);
}

void LogManager::setMinimumLoggedSeverity(LogComponent component, LogSeverity severity) {
    _minimumSeverity[component].store(severity.toInt());
}

void LogManager::write(LogSeverity severity, const std::string& line) {
    BOOST_LOG_SEV(_source, severity.toInt()) << line;
}

bool shouldLog(LogComponent component, LogSeverity severity) {
    return LogManager::global().shouldLog(component, severity);
}

void setMinimumLoggedSeverity(LogComponent component, LogSeverity severity) {
    LogManager::global().setMinimumLoggedSeverity(component, severity);
}

void setThreadName(std::string name) {
    threadName = std::move(name);
}

const std::string& getThreadName() {
    return threadName;
}

namespace detail {

void doLogImpl(int id,
               LogSeverity severity,
               LogComponent component,
               const char* message,
               std::initializer_list<NamedAttribute> attrs) {
    auto& manager = LogManager::global();
    if (!manager.shouldLog(component, severity))
        return;

    fmt::memory_buffer buffer;
    auto out = std::back_inserter(buffer);
    fmt::format_to(out,
                   R"({{"t":{{"$date":"{}"}},"s":"{}","c":"{}","id":{},"ctx":"{}","msg":"{}")",
                   Date_t::now().toString(),
                   severity.toStringDataCompact(),
                   component.getShortName(),
                   id,
                   str::escape(threadName),
                   str::escape(formatMessage(message, attrs)));
    if (attrs.size() > 0) {
        fmt::format_to(out, R"(,"attr":{{)");
        bool first = true;
        for (const auto& attr : attrs) {
            fmt::format_to(out, R"({}"{}":{})", first ? "" : ",", attr.name, attr.json);
            first = false;
        }
        fmt::format_to(out, "}}");
    }
    fmt::format_to(out, "}}");

    manager.write(severity, fmt::to_string(buffer));
}

}  // namespace detail
}  // namespace logv2
}  // namespace shake
