// SPDX-License-Identifier: MIT

// src/log.hpp
#pragma once

#include <sstream>
#include <string>

#include <nitro/log/attribute/jiffy.hpp>
#include <nitro/log/attribute/severity.hpp>
#include <nitro/log/filter/severity_filter.hpp>
#include <nitro/log/log.hpp>
#include <nitro/log/sink/stdout.hpp>

namespace tsdb_pipe {

namespace log_detail {

using LogRecord = nitro::log::record<nitro::log::tag_attribute, nitro::log::message_attribute,
                                     nitro::log::severity_attribute, nitro::log::jiffy_attribute>;

// One line per record: "<jiffy> <severity> <tag>: <message>", the tag
// omitted when empty.
template <typename Record>
class LineFormatter {
public:
    std::string format(Record& r) {
        std::ostringstream line;
        line << r.jiffy() << ' ' << r.severity();
        if (!r.tag().empty()) line << ' ' << r.tag();
        line << ": " << r.message() << '\n';
        return line.str();
    }
};

template <typename Record>
using SeverityFilter = nitro::log::filter::severity_filter<Record>;

}  // namespace log_detail

// Log::warn("subscribe") << "channel full, dropping message";
using Log = nitro::log::logger<log_detail::LogRecord, log_detail::LineFormatter,
                               nitro::log::sink::StdOut, log_detail::SeverityFilter>;

// Records below `level` are discarded
inline void SetLogLevel(nitro::log::severity_level level) {
    log_detail::SeverityFilter<log_detail::LogRecord>::set_severity(level);
}

}  // namespace tsdb_pipe
