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

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <boost/optional.hpp>

#include "shake/base/status_with.h"
#include "shake/bson/bsonobj.h"
#include "shake/bson/timestamp.h"
#include "shake/db/repl/ddl_sync_options.h"
#include "shake/db/repl/oplog_entry.h"
#include "shake/db/repl/sync_progress.h"
#include "shake/util/clock_source.h"
#include "shake/util/concurrency/notification.h"
#include "shake/util/periodic_runner.h"

namespace shake {

class ShardingCatalogClient;

namespace repl {

/**
 * Identifies "the same" DDL reported by several sources: the namespace it was logged under and
 * the exact bytes of its command body.
 */
struct DdlKey {
    std::string ns;
    std::string body;

    static StatusWith<DdlKey> fromEntry(const OplogEntry& entry);

    /** The command body as a BSONObj viewing 'body'. */
    BSONObj getBody() const {
        return BSONObj(body.data());
    }

    std::string toString() const;

    bool operator==(const DdlKey& other) const = default;
    auto operator<=>(const DdlKey& other) const = default;
};

/**
 * A DDL waiting in the registry for the elimination loop to release it.
 *
 * The key and captured entry are immutable. The set of reporters is owned by the DdlManager and
 * only read or written under its mutex.
 */
class PendingDdl {
public:
    PendingDdl(DdlKey key, OplogEntry blockEntry)
        : _key(std::move(key)), _blockEntry(std::move(blockEntry)) {}

    PendingDdl(const PendingDdl&) = delete;
    PendingDdl& operator=(const PendingDdl&) = delete;

    const DdlKey& getKey() const {
        return _key;
    }

    /** The entry of the first source that reported this DDL. */
    const OplogEntry& getBlockEntry() const {
        return _blockEntry;
    }

    bool isReleased() const {
        return static_cast<bool>(_released);
    }

private:
    friend class DdlManager;

    const DdlKey _key;
    const OplogEntry _blockEntry;

    Notification<bool> _released;

    // Replica set name -> timestamp at which that source reported this DDL.
    absl::flat_hash_map<std::string, Timestamp> _reportedBy;
};

/**
 * Coordinates DDL application across the replica sets feeding one target.
 *
 * A worker that reads a DDL from its source reports it here and blocks until the DDL is
 * released. A periodic job, the elimination loop, repeatedly picks the pending DDL with the
 * earliest reported timestamp and releases it once that is safe:
 *  - immediately if the source is sharded and the DDL's collection is not sharded on it;
 *  - immediately for additive commands, index inserts and commands not known to be unsafe;
 *  - for drops, only once every other source reported the same DDL, has applied past it, or has
 *    been silent for longer than the unresponsiveness threshold;
 *  - never for commands with no multi-source translation; those return IllegalDdlOperation.
 *
 * Only one DDL is released per tick. The registry mutex is never held while a worker waits or
 * while the sharding catalog is queried.
 */
class DdlManager {
public:
    struct Options {
        DdlSyncOptions syncOptions;

        // Reader of the source cluster's sharding catalog; null when the source is not sharded.
        ShardingCatalogClient* catalogClient = nullptr;

        ClockSource* clockSource = SystemClockSource::get();
    };

    explicit DdlManager(Options options);
    ~DdlManager();

    DdlManager(const DdlManager&) = delete;
    DdlManager& operator=(const DdlManager&) = delete;

    /**
     * Starts the elimination loop. A non-OK tick aborts the process.
     */
    void startup();

    /**
     * Stops the elimination loop. Workers still blocked stay blocked.
     */
    void shutdown();

    /**
     * Makes the progress of 'replSetName' visible to the elimination loop. Sources that are not
     * added are not waited for by destructive DDLs. A source that has not returned data yet
     * counts as responsive from the moment it is added.
     */
    void addSyncer(const std::string& replSetName, std::shared_ptr<SyncProgress> progress);

    /**
     * Records that 'replSetName' reached 'entry'. Creates the pending DDL on first report; a
     * later report of the same DDL from the same source overwrites its timestamp. Fails with
     * InvalidBSON if the command body is not valid BSON.
     */
    StatusWith<std::shared_ptr<PendingDdl>> registerDdl(std::string_view replSetName,
                                                        const OplogEntry& entry);

    /**
     * Blocks until 'pending' is released. Returns the value it was released with, which is
     * always true.
     */
    bool waitForRelease(const std::shared_ptr<PendingDdl>& pending);

    /**
     * Wakes every waiter of the DDL identified by 'key' and removes it from the registry.
     * Returns DdlNotRegistered if no such DDL is pending.
     */
    Status releaseDdl(const DdlKey& key);

    /**
     * The worker side of the barrier: reports 'entry', catches the source's synced position up
     * with what it has read, then waits for the release with 'checkpointReadLock' unlocked so
     * checkpoints are not held off. The lock is held again on return.
     */
    StatusWith<bool> blockDdl(std::string_view replSetName,
                              const OplogEntry& entry,
                              std::shared_lock<std::shared_mutex>& checkpointReadLock);

    /**
     * Produces the operations the target must apply for a released DDL, reading the sharding
     * definition of its collection when the source is sharded.
     */
    StatusWith<std::vector<OplogEntry>> transformReleasedDdl(std::string_view replSetName,
                                                             const OplogEntry& entry);

    /**
     * blockDdl() followed by transformReleasedDdl(). Errors from either abort the process.
     */
    std::vector<OplogEntry> syncDdl(std::string_view replSetName,
                                    const OplogEntry& entry,
                                    std::shared_lock<std::shared_mutex>& checkpointReadLock);

    /**
     * One tick of the elimination loop. Releases at most one DDL. Returns a non-OK status only
     * for conditions that must stop replication.
     */
    Status eliminateBlock();

    std::size_t pendingCount() const;

    /**
     * Returns the pending DDLs and the progress of every known source, for diagnostics.
     */
    BSONObj toBSON() const;

private:
    struct Candidate {
        std::shared_ptr<PendingDdl> pending;
        Timestamp minTs;
        std::vector<std::string> reporters;
    };

    boost::optional<Candidate> _selectEarliest_inlock() const;

    // Releases the DDL pending under 'key'. When 'expected' is set, fails unless that is the
    // entry still pending under 'key'.
    Status _releaseDdl_inlock(const DdlKey& key,
                              const PendingDdl* expected,
                              std::string_view reason);

    std::shared_ptr<SyncProgress> _getSyncer(std::string_view replSetName) const;

    // Checks whether every known source has passed the DDL. Returns false and logs the first
    // source that has not.
    bool _allSourcesPassed(const Candidate& candidate);

    const Options _options;

    PeriodicJobAnchor _eliminatorJob;

    mutable std::mutex _mutex;

    std::map<DdlKey, std::shared_ptr<PendingDdl>> _pending;

    absl::flat_hash_map<std::string, std::shared_ptr<SyncProgress>> _syncers;

    // The most recently released entry. Released entries leave _pending at once, so a tick never
    // selects it again.
    std::shared_ptr<PendingDdl> _lastReleased;
};

}  // namespace repl
}  // namespace shake
