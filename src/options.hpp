// SPDX-License-Identifier: MIT

// src/options.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "src/query_response.hpp"

namespace tsdb_pipe {

// Returns the value of an environment variable, std::nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

// Reads the process environment
std::optional<std::string> SystemEnvironment(std::string_view name);

// Connection and behaviour settings for TsdbClient
struct DbOptions {
    std::string database_addr = "http://127.0.0.1:6041";
    std::string database_name = "iot";
    std::string database_user = "root";
    std::string database_pass = "taosdata";
    std::string precision_unit = "ms";

    bool convert_number = false;
    // Write timestamp in precision units; <= 0 lets the server assign the time
    int64_t timestamp = 0;
    // Substituted for non-numeric values in numeric columns when converting
    Value default_number_value{};

    std::string write_encoding;              // "" or "gzip"
    std::chrono::milliseconds timeout{0};    // 0 = no timeout
    bool insecure_skip_verify = false;

    // Defaults overlaid with SVC_IOT_TDENGINE_{HOST,PORT,USER,PASS,PREC,DB}.
    // HOST without PORT uses port 6041. Empty variables are ignored.
    static DbOptions FromEnvironment(const EnvLookup& lookup = SystemEnvironment);
};

}  // namespace tsdb_pipe
