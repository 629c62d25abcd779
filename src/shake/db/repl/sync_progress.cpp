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

#include "shake/db/repl/sync_progress.h"

#include <algorithm>

#include "shake/bson/bsonobjbuilder.h"

namespace shake {
namespace repl {

Timestamp SyncProgress::getSyncedTs() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _syncedTs;
}

Timestamp SyncProgress::getUnsyncedTs() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _unsyncedTs;
}

Date_t SyncProgress::getLastResponseTime() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _lastResponseTime;
}

void SyncProgress::advanceUnsyncedTs(Timestamp ts) {
    std::lock_guard<std::mutex> lk(_mutex);
    _unsyncedTs = std::max(_unsyncedTs, ts);
}

void SyncProgress::advanceSyncedTs(Timestamp ts) {
    std::lock_guard<std::mutex> lk(_mutex);
    _syncedTs = std::max(_syncedTs, ts);
    _unsyncedTs = std::max(_unsyncedTs, _syncedTs);
}

void SyncProgress::markResponse(Date_t when) {
    std::lock_guard<std::mutex> lk(_mutex);
    _lastResponseTime = std::max(_lastResponseTime, when);
}

void SyncProgress::markBlockedAtDdl() {
    std::lock_guard<std::mutex> lk(_mutex);
    _syncedTs = std::max(_syncedTs, _unsyncedTs);
}

BSONObj SyncProgress::toBSON() const {
    std::lock_guard<std::mutex> lk(_mutex);
    BSONObjBuilder b;
    b.append("replSet", _replSetName);
    b.append("syncedTs", _syncedTs);
    b.append("unsyncedTs", _unsyncedTs);
    b.append("lastResponseTime", _lastResponseTime);
    return b.obj();
}

}  // namespace repl
}  // namespace shake
