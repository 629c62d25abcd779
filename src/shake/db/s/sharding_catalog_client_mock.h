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

#include <map>
#include <mutex>

#include "shake/db/s/sharding_catalog_client.h"

namespace shake {

/**
 * In-memory sharding catalog. Entries are keyed by namespace; setReadError() makes every
 * subsequent lookup fail until cleared.
 */
class ShardingCatalogClientMock final : public ShardingCatalogClient {
public:
    StatusWith<boost::optional<BSONObj>> findCollectionEntry(const NamespaceString& nss) override {
        std::lock_guard<std::mutex> lk(_mutex);
        ++_numLookups;
        if (!_readError.isOK())
            return _readError;
        auto it = _entries.find(nss);
        if (it == _entries.end())
            return boost::optional<BSONObj>();
        return boost::optional<BSONObj>(it->second);
    }

    void setCollectionEntry(const NamespaceString& nss, const BSONObj& doc) {
        std::lock_guard<std::mutex> lk(_mutex);
        _entries[nss] = doc.getOwned();
    }

    void setShardedCollection(const ShardCollectionSpec& spec) {
        setCollectionEntry(spec.getNss(), spec.toBSON());
    }

    void removeCollectionEntry(const NamespaceString& nss) {
        std::lock_guard<std::mutex> lk(_mutex);
        _entries.erase(nss);
    }

    void setReadError(Status status) {
        std::lock_guard<std::mutex> lk(_mutex);
        _readError = std::move(status);
    }

    int getNumLookups() const {
        std::lock_guard<std::mutex> lk(_mutex);
        return _numLookups;
    }

private:
    mutable std::mutex _mutex;
    std::map<NamespaceString, BSONObj> _entries;
    Status _readError = Status::OK();
    int _numLookups = 0;
};

}  // namespace shake
