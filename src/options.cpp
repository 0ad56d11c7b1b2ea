// SPDX-License-Identifier: MIT

// src/options.cpp
#include "src/options.hpp"

#include <cstdlib>

#include <fmt/format.h>

namespace tsdb_pipe {

namespace {

constexpr std::string_view kEnvHost = "SVC_IOT_TDENGINE_HOST";
constexpr std::string_view kEnvPort = "SVC_IOT_TDENGINE_PORT";
constexpr std::string_view kEnvUser = "SVC_IOT_TDENGINE_USER";
constexpr std::string_view kEnvPass = "SVC_IOT_TDENGINE_PASS";
constexpr std::string_view kEnvPrec = "SVC_IOT_TDENGINE_PREC";
constexpr std::string_view kEnvName = "SVC_IOT_TDENGINE_DB";

constexpr std::string_view kDefaultPort = "6041";

std::optional<std::string> NonEmpty(const EnvLookup& lookup, std::string_view name) {
    auto value = lookup(name);
    if (!value || value->empty()) return std::nullopt;
    return value;
}

}  // namespace

std::optional<std::string> SystemEnvironment(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

DbOptions DbOptions::FromEnvironment(const EnvLookup& lookup) {
    DbOptions opts;

    if (auto host = NonEmpty(lookup, kEnvHost)) {
        auto port = NonEmpty(lookup, kEnvPort);
        opts.database_addr = fmt::format("http://{}:{}", *host,
                                         port ? std::string_view(*port) : kDefaultPort);
    }
    if (auto user = NonEmpty(lookup, kEnvUser)) opts.database_user = std::move(*user);
    if (auto pass = NonEmpty(lookup, kEnvPass)) opts.database_pass = std::move(*pass);
    if (auto prec = NonEmpty(lookup, kEnvPrec)) opts.precision_unit = std::move(*prec);
    if (auto name = NonEmpty(lookup, kEnvName)) opts.database_name = std::move(*name);

    return opts;
}

}  // namespace tsdb_pipe
