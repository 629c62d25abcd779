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

#include "shake/db/repl/ddl_manager.h"

#include <algorithm>

#include "shake/bson/bson_validate.h"
#include "shake/bson/bsonobjbuilder.h"
#include "shake/db/repl/ddl_command.h"
#include "shake/db/repl/ddl_transformer.h"
#include "shake/db/s/sharding_catalog_client.h"
#include "shake/logv2/log.h"
#include "shake/util/str.h"

namespace shake {
namespace repl {

namespace {

std::string joinNames(const std::vector<std::string>& names) {
    str::stream ss;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0)
            ss << ", ";
        ss << names[i];
    }
    return ss;
}

}  // namespace

StatusWith<DdlKey> DdlKey::fromEntry(const OplogEntry& entry) {
    const BSONObj& body = entry.getObject();
    if (auto status = validateBSON(body); !status.isOK())
        return status.withContext(str::stream()
                                  << "cannot identify DDL on " << entry.getNss());
    return DdlKey{entry.getNss().ns(), body.toBuffer()};
}

std::string DdlKey::toString() const {
    return str::stream() << "{ ns: \"" << ns << "\", o: " << getBody() << " }";
}

DdlManager::DdlManager(Options options) : _options(std::move(options)) {
    invariant(_options.clockSource);
}

DdlManager::~DdlManager() {
    shutdown();
}

void DdlManager::startup() {
    invariant(!_eliminatorJob.isRunning());
    _eliminatorJob = PeriodicRunner::makeJob(PeriodicRunner::PeriodicJob(
        "DdlEliminator",
        [this] { fassert(5210230, eliminateBlock()); },
        _options.syncOptions.checkInterval));
    _eliminatorJob.start();

    LOGV2(5210201,
          "Started DDL elimination loop",
          "options"_attr = _options.syncOptions.toBSON(),
          "shardedSource"_attr = _options.catalogClient != nullptr);
}

void DdlManager::shutdown() {
    _eliminatorJob.stop();
}

void DdlManager::addSyncer(const std::string& replSetName,
                           std::shared_ptr<SyncProgress> progress) {
    // A source that has not returned data yet is not idle; its idle time starts now.
    progress->markResponse(_options.clockSource->now());

    std::lock_guard<std::mutex> lk(_mutex);
    _syncers[replSetName] = std::move(progress);
}

std::shared_ptr<SyncProgress> DdlManager::_getSyncer(std::string_view replSetName) const {
    std::lock_guard<std::mutex> lk(_mutex);
    auto it = _syncers.find(absl::string_view(replSetName.data(), replSetName.size()));
    return it == _syncers.end() ? nullptr : it->second;
}

StatusWith<std::shared_ptr<PendingDdl>> DdlManager::registerDdl(std::string_view replSetName,
                                                                const OplogEntry& entry) {
    auto swKey = DdlKey::fromEntry(entry);
    if (!swKey.isOK())
        return swKey.getStatus().withContext(str::stream()
                                             << "syncer " << replSetName << " reported DDL "
                                             << entry.getTimestamp());

    std::lock_guard<std::mutex> lk(_mutex);
    auto& pending = _pending[swKey.getValue()];
    if (!pending)
        pending = std::make_shared<PendingDdl>(swKey.getValue(), entry);
    pending->_reportedBy[std::string(replSetName)] = entry.getTimestamp();
    return pending;
}

bool DdlManager::waitForRelease(const std::shared_ptr<PendingDdl>& pending) {
    return pending->_released.get();
}

Status DdlManager::releaseDdl(const DdlKey& key) {
    std::lock_guard<std::mutex> lk(_mutex);
    return _releaseDdl_inlock(key, nullptr, "released");
}

Status DdlManager::_releaseDdl_inlock(const DdlKey& key,
                                      const PendingDdl* expected,
                                      std::string_view reason) {
    auto it = _pending.find(key);
    if (it == _pending.end() || (expected && it->second.get() != expected))
        return Status(ErrorCodes::DdlNotRegistered,
                      str::stream() << "DDL " << key.toString() << " is not pending");

    auto pending = std::move(it->second);
    _pending.erase(it);
    _lastReleased = pending;
    pending->_released.set(true);

    LOGV2(5210202,
          "Released DDL",
          "ns"_attr = key.ns,
          "ddl"_attr = key.getBody(),
          "reason"_attr = reason,
          "reportedBy"_attr = static_cast<long long>(pending->_reportedBy.size()));
    return Status::OK();
}

StatusWith<bool> DdlManager::blockDdl(std::string_view replSetName,
                                      const OplogEntry& entry,
                                      std::shared_lock<std::shared_mutex>& checkpointReadLock) {
    auto progress = _getSyncer(replSetName);
    if (!progress)
        return Status(ErrorCodes::NoSuchKey,
                      str::stream() << "syncer " << replSetName << " is not registered");

    auto swPending = registerDdl(replSetName, entry);
    if (!swPending.isOK())
        return swPending.getStatus();
    const auto& pending = swPending.getValue();

    LOGV2(5210203,
          "Syncer blocked at DDL",
          "replSet"_attr = replSetName,
          "ts"_attr = entry.getTimestamp(),
          "ns"_attr = entry.getNss(),
          "ddl"_attr = entry.getObject());

    // The DDL is the only entry of its batch: everything read before it has been applied.
    progress->advanceUnsyncedTs(entry.getTimestamp());
    progress->markBlockedAtDdl();
    invariant(progress->getSyncedTs() == progress->getUnsyncedTs());

    invariant(checkpointReadLock.owns_lock());
    checkpointReadLock.unlock();
    const bool proceed = waitForRelease(pending);
    checkpointReadLock.lock();

    LOGV2(5210204,
          "Syncer unblocked at DDL",
          "replSet"_attr = replSetName,
          "ts"_attr = entry.getTimestamp(),
          "ns"_attr = entry.getNss());
    return proceed;
}

StatusWith<std::vector<OplogEntry>> DdlManager::transformReleasedDdl(
    std::string_view replSetName, const OplogEntry& entry) {
    boost::optional<ShardCollectionSpec> shardSpec;
    if (_options.catalogClient) {
        if (auto nss = getDdlTargetCollection(entry)) {
            auto swSpec = getShardCollectionSpec(_options.catalogClient, *nss);
            if (!swSpec.isOK())
                return swSpec.getStatus();
            shardSpec = std::move(swSpec.getValue());
        }
    }
    return transformDdl(replSetName, entry, shardSpec, _options.syncOptions.targetIsSharded);
}

std::vector<OplogEntry> DdlManager::syncDdl(
    std::string_view replSetName,
    const OplogEntry& entry,
    std::shared_lock<std::shared_mutex>& checkpointReadLock) {
    const bool proceed = fassert(5210231, blockDdl(replSetName, entry, checkpointReadLock));
    invariant(proceed);
    return fassert(5210232, transformReleasedDdl(replSetName, entry));
}

boost::optional<DdlManager::Candidate> DdlManager::_selectEarliest_inlock() const {
    boost::optional<Candidate> best;
    // _pending is ordered by key, so equal timestamps resolve to the smallest key.
    for (const auto& [key, pending] : _pending) {
        for (const auto& [replSet, ts] : pending->_reportedBy) {
            if (!best || ts < best->minTs)
                best = Candidate{pending, ts, {}};
        }
    }
    if (best) {
        for (const auto& [replSet, ts] : best->pending->_reportedBy)
            best->reporters.push_back(replSet);
        std::sort(best->reporters.begin(), best->reporters.end());
    }
    return best;
}

bool DdlManager::_allSourcesPassed(const Candidate& candidate) {
    std::vector<std::pair<std::string, std::shared_ptr<SyncProgress>>> syncers;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        syncers.assign(_syncers.begin(), _syncers.end());
    }
    std::sort(syncers.begin(), syncers.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });

    const auto now = _options.clockSource->now();
    std::vector<std::string> idleSources;
    for (const auto& [replSet, progress] : syncers) {
        if (std::binary_search(
                candidate.reporters.begin(), candidate.reporters.end(), replSet))
            continue;

        const auto syncedTs = progress->getSyncedTs();
        if (syncedTs >= candidate.minTs)
            continue;

        const auto lastResponseTime = progress->getLastResponseTime();
        if (now > lastResponseTime + _options.syncOptions.unresponsiveThreshold) {
            idleSources.push_back(replSet);
            continue;
        }

        LOGV2(5210205,
              "Cannot release DDL yet, a source has not reached it",
              "ddl"_attr = candidate.pending->getKey().toString(),
              "replSet"_attr = replSet,
              "ddlMinTs"_attr = candidate.minTs,
              "syncedTs"_attr = syncedTs,
              "lastResponseTime"_attr = lastResponseTime);
        return false;
    }

    if (!idleSources.empty()) {
        LOGV2_WARNING(5210206,
                      "Releasing DDL without waiting for unresponsive sources",
                      "ddl"_attr = candidate.pending->getKey().toString(),
                      "unresponsive"_attr = joinNames(idleSources),
                      "threshold"_attr =
                          durationToString(_options.syncOptions.unresponsiveThreshold));
    }
    return true;
}

Status DdlManager::eliminateBlock() {
    boost::optional<Candidate> candidate;
    {
        std::lock_guard<std::mutex> lk(_mutex);
        if (_pending.empty())
            return Status::OK();

        LOGV2_DEBUG(5210207, 1, "DDL block table", "pending"_attr = _pending.size());
        candidate = _selectEarliest_inlock();
        invariant(candidate);
    }

    const auto& key = candidate->pending->getKey();
    const auto& entry = candidate->pending->getBlockEntry();

    // The registry lock was dropped after selection, so release only the entry selected above.
    // Anything else pending under 'key' now was registered after a concurrent release.
    auto release = [&](std::string_view reason) {
        std::lock_guard<std::mutex> lk(_mutex);
        return _releaseDdl_inlock(key, candidate->pending.get(), reason);
    };

    // A DDL that names no collection, such as dropDatabase, may span sharded collections and
    // goes through the per-command rules below.
    auto targetNss = getDdlTargetCollection(entry);
    if (_options.catalogClient && targetNss) {
        if (_options.syncOptions.metadataSettleDelay > Milliseconds::zero())
            _options.clockSource->sleepFor(_options.syncOptions.metadataSettleDelay);

        auto swSpec = getShardCollectionSpec(_options.catalogClient, *targetNss);
        if (!swSpec.isOK()) {
            LOGV2_WARNING(5210209,
                          "Failed to read sharding metadata, will retry",
                          "ddl"_attr = key.toString(),
                          "nss"_attr = *targetNss,
                          "error"_attr = swSpec.getStatus());
            return Status::OK();
        }
        if (!swSpec.getValue())
            return release("collection is not sharded");
    }

    switch (classifyDdl(entry)) {
        case DdlCommandCategory::kIndexBookkeeping:
            return release("index insert");
        case DdlCommandCategory::kAdditive:
            return release("additive DDL");
        case DdlCommandCategory::kDestructive:
            if (!_allSourcesPassed(*candidate))
                return Status::OK();
            return release("every source passed the DDL");
        case DdlCommandCategory::kUnsupported:
            return Status(ErrorCodes::IllegalDdlOperation,
                          str::stream() << "illegal DDL " << key.toString() << " reported by "
                                        << joinNames(candidate->reporters));
        case DdlCommandCategory::kUnknown:
            break;
    }

    LOGV2_WARNING(5210210,
                  "Releasing DDL with unrecognized command",
                  "ddl"_attr = key.toString(),
                  "command"_attr = entry.getCommandName());
    return release("unrecognized command");
}

std::size_t DdlManager::pendingCount() const {
    std::lock_guard<std::mutex> lk(_mutex);
    return _pending.size();
}

BSONObj DdlManager::toBSON() const {
    std::lock_guard<std::mutex> lk(_mutex);

    BSONArrayBuilder pendingArr;
    for (const auto& [key, pending] : _pending) {
        BSONObjBuilder reportedBy;
        for (const auto& [replSet, ts] : pending->_reportedBy)
            reportedBy.append(replSet, ts);

        BSONObjBuilder b;
        b.append("ns", key.ns);
        b.append("o", key.getBody());
        b.append("reportedBy", reportedBy.obj());
        pendingArr.append(b.obj());
    }

    BSONArrayBuilder syncersArr;
    for (const auto& [replSet, progress] : _syncers)
        syncersArr.append(progress->toBSON());

    BSONObjBuilder out;
    out.append("pending", pendingArr.arr());
    out.append("syncers", syncersArr.arr());
    if (_lastReleased)
        out.append("lastReleased", _lastReleased->getKey().ns);
    return out.obj();
}

}  // namespace repl
}  // namespace shake
