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

#include <concepts>
#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

#include "shake/util/str.h"

namespace shake {
namespace logv2 {
namespace detail {

/**
 * An attribute captured by a LOGV2 call site. 'text' is substituted into the message's '{name}'
 * placeholders and 'json' is the value as it appears in the "attr" object of the rendered line.
 */
struct NamedAttribute {
    const char* name;
    std::string text;
    std::string json;
};

template <typename T>
concept HasJsonString = requires(const T& t) {
    { t.jsonString() } -> std::convertible_to<std::string>;
};

template <typename T>
concept HasToString = requires(const T& t) {
    { t.toString() } -> std::convertible_to<std::string>;
};

template <typename T>
concept Streamable = requires(std::ostream& os, const T& t) { os << t; };

inline std::string quoted(std::string_view s) {
    return "\"" + str::escape(s) + "\"";
}

template <typename T>
NamedAttribute makeAttribute(const char* name, const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        std::string s = value ? "true" : "false";
        return {name, s, s};
    } else if constexpr (std::is_arithmetic_v<T> || std::is_enum_v<T>) {
        std::string s;
        if constexpr (std::is_enum_v<T>)
            s = fmt::format("{}", static_cast<std::underlying_type_t<T>>(value));
        else
            s = fmt::format("{}", value);
        return {name, s, s};
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        std::string_view sv = value;
        return {name, std::string(sv), quoted(sv)};
    } else if constexpr (HasJsonString<T> && HasToString<T>) {
        return {name, value.toString(), value.jsonString()};
    } else if constexpr (HasToString<T>) {
        std::string s = value.toString();
        return {name, s, quoted(s)};
    } else {
        static_assert(Streamable<T>, "attribute type is not loggable");
        std::ostringstream os;
        os << value;
        return {name, os.str(), quoted(os.str())};
    }
}

/**
 * The left-hand side of a `"name"_attr = value` expression.
 */
struct AttrUdl {
    const char* name;

    template <typename T>
    NamedAttribute operator=(const T& value) const {
        return makeAttribute(name, value);
    }
};

}  // namespace detail
}  // namespace logv2

inline namespace literals {

constexpr logv2::detail::AttrUdl operator""_attr(const char* name, std::size_t) {
    return {name};
}

}  // namespace literals
}  // namespace shake
