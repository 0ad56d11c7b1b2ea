// SPDX-License-Identifier: MIT

// src/escape.hpp
#pragma once

#include <string>
#include <string_view>

namespace tsdb_pipe {

// Line-protocol escaping for names, tag keys, tag values and field keys.
//
// The reserved set is ',', '"', ' ' and '='; each is written as a backslash
// followed by the character. UnescapeString(EscapeString(s)) == s for every s.
std::string EscapeString(std::string_view in);

// Inverse of EscapeString. A backslash not followed by a reserved character is
// kept as is. Returns the input unchanged when it holds no backslash.
std::string UnescapeString(std::string_view in);

// True for the characters EscapeString prefixes with a backslash
constexpr bool IsReservedChar(char c) {
    return c == ',' || c == '"' || c == ' ' || c == '=';
}

}  // namespace tsdb_pipe
