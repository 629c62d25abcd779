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

#include <iosfwd>
#include <string>
#include <string_view>

#include "shake/base/status_with.h"

namespace shake {

/**
 * A namespace of the form "<database>.<collection>". The collection part may itself contain
 * dots, e.g. "test.system.indexes".
 */
class NamespaceString {
public:
    // Name of the collection that recorded index builds before the createIndexes command existed.
    static constexpr std::string_view kSystemDotIndexesCollectionName = "system.indexes";

    // Suffix of the namespace that database commands are logged under.
    static constexpr std::string_view kCommandCollectionName = "$cmd";

    // The sharding catalog's collection metadata, one document per sharded collection.
    static const NamespaceString kConfigsvrCollectionsNamespace;

    NamespaceString() = default;

    explicit NamespaceString(std::string ns) : _ns(std::move(ns)) {
        _dotIndex = _ns.find('.');
    }

    NamespaceString(std::string_view db, std::string_view coll);

    /**
     * Parses 'ns', rejecting the empty string and namespaces without a database name.
     */
    static StatusWith<NamespaceString> parse(std::string_view ns);

    const std::string& ns() const {
        return _ns;
    }

    const std::string& toString() const {
        return _ns;
    }

    std::string_view db() const {
        return _dotIndex == std::string::npos ? std::string_view(_ns)
                                              : std::string_view(_ns).substr(0, _dotIndex);
    }

    std::string_view coll() const {
        return _dotIndex == std::string::npos ? std::string_view()
                                              : std::string_view(_ns).substr(_dotIndex + 1);
    }

    bool isEmpty() const {
        return _ns.empty();
    }

    /** Returns true for "<db>.$cmd", the namespace database commands are logged under. */
    bool isCommand() const {
        return coll() == kCommandCollectionName;
    }

    /**
     * Returns true for the "system.indexes" collection of any database, whose inserts describe
     * index builds.
     */
    bool isSystemDotIndexes() const;

    /**
     * Returns the namespace of the collection 'coll' in this namespace's database.
     */
    NamespaceString getSisterNS(std::string_view coll) const {
        return NamespaceString(db(), coll);
    }

    bool operator==(const NamespaceString& other) const {
        return _ns == other._ns;
    }

    auto operator<=>(const NamespaceString& other) const {
        return _ns <=> other._ns;
    }

    template <typename H>
    friend H AbslHashValue(H h, const NamespaceString& nss) {
        return H::combine(std::move(h), nss._ns);
    }

private:
    std::string _ns;
    std::size_t _dotIndex = std::string::npos;
};

std::ostream& operator<<(std::ostream& stream, const NamespaceString& nss);

}  // namespace shake
