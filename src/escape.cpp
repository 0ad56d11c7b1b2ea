// SPDX-License-Identifier: MIT

// src/escape.cpp
#include "src/escape.hpp"

namespace tsdb_pipe {

std::string EscapeString(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        if (IsReservedChar(c)) out += '\\';
        out += c;
    }
    return out;
}

std::string UnescapeString(std::string_view in) {
    if (in.find('\\') == std::string_view::npos) {
        return std::string(in);
    }

    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '\\' && i + 1 < in.size() && IsReservedChar(in[i + 1])) {
            out += in[i + 1];
            ++i;
            continue;
        }
        out += in[i];
    }
    return out;
}

}  // namespace tsdb_pipe
