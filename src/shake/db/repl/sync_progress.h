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

#include <mutex>
#include <string>

#include "shake/bson/bsonobj.h"
#include "shake/bson/timestamp.h"
#include "shake/util/time_support.h"

namespace shake {
namespace repl {

/**
 * Replication progress of one source replica set, shared between the worker syncing that source
 * and the DdlManager.
 *
 *  - syncedTs: the timestamp up to which this source's oplog has been fully applied downstream.
 *  - unsyncedTs: the timestamp of the latest entry read from the source, applied or not.
 *  - lastResponseTime: when the source last returned data to its worker.
 *
 * All members are safe to call concurrently.
 */
class SyncProgress {
public:
    explicit SyncProgress(std::string replSetName) : _replSetName(std::move(replSetName)) {}

    SyncProgress(const SyncProgress&) = delete;
    SyncProgress& operator=(const SyncProgress&) = delete;

    const std::string& getReplSetName() const {
        return _replSetName;
    }

    Timestamp getSyncedTs() const;
    Timestamp getUnsyncedTs() const;
    Date_t getLastResponseTime() const;

    /**
     * Records that entries up to 'ts' were read from the source. Never moves backwards.
     */
    void advanceUnsyncedTs(Timestamp ts);

    /**
     * Records that entries up to 'ts' were applied downstream. Never moves backwards.
     */
    void advanceSyncedTs(Timestamp ts);

    /**
     * Records that the source returned data at 'when'.
     */
    void markResponse(Date_t when);

    /**
     * Called by a worker about to wait at a DDL: everything read before the DDL has been applied,
     * so the synced position catches up with the read position.
     */
    void markBlockedAtDdl();

    BSONObj toBSON() const;

private:
    const std::string _replSetName;

    mutable std::mutex _mutex;
    Timestamp _syncedTs;
    Timestamp _unsyncedTs;
    Date_t _lastResponseTime;
};

}  // namespace repl
}  // namespace shake
