// SPDX-License-Identifier: MIT

// lib/net/gzip.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "lib/net/error.hpp"

namespace tsdb_pipe {

// Compress data into a single gzip member (RFC 1952), default level.
std::expected<std::string, Error> GzipCompress(std::string_view data);

// Inflate a gzip stream, as sent with Content-Encoding: gzip.
std::expected<std::string, Error> GzipDecompress(std::string_view data);

namespace detail {

// zlib takes at most max_input bytes of input per call. The public functions
// pass the largest count a uInt holds.
std::expected<std::string, Error> GzipCompress(std::string_view data, size_t max_input);
std::expected<std::string, Error> GzipDecompress(std::string_view data, size_t max_input);

}  // namespace detail

}  // namespace tsdb_pipe
