// SPDX-License-Identifier: MIT

// lib/net/gzip.cpp
#include "lib/net/gzip.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <limits>

namespace tsdb_pipe {

namespace {

// windowBits + 16 selects the gzip wrapper instead of raw zlib
constexpr int kGzipWindowBits = 15 + 16;
constexpr size_t kChunkSize = 16 * 1024;
constexpr size_t kMaxZlibInput = std::numeric_limits<uInt>::max();

Error ZlibError(const char* what, int ret, const z_stream& zs) {
    std::string msg = what;
    msg += " failed: ";
    msg += zs.msg != nullptr ? zs.msg : zError(ret);
    return Error{ErrorCode::CompressionError, std::move(msg)};
}

// Hand the next slice of `rest` to zlib
void FeedInput(z_stream& zs, std::string_view& rest, size_t max_input) {
    const size_t n = std::min(rest.size(), max_input);
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(rest.data()));
    zs.avail_in = static_cast<uInt>(n);
    rest.remove_prefix(n);
}

}  // namespace

std::expected<std::string, Error> GzipCompress(std::string_view data) {
    return detail::GzipCompress(data, kMaxZlibInput);
}

std::expected<std::string, Error> GzipDecompress(std::string_view data) {
    return detail::GzipDecompress(data, kMaxZlibInput);
}

namespace detail {

std::expected<std::string, Error> GzipCompress(std::string_view data, size_t max_input) {
    max_input = std::clamp<size_t>(max_input, 1, kMaxZlibInput);

    z_stream zs{};
    int ret = deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits,
                           8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return std::unexpected(ZlibError("deflateInit2", ret, zs));
    }

    std::string out;
    out.reserve(data.size() / 2 + 64);
    std::array<char, kChunkSize> buf;
    std::string_view rest = data;
    int flush = Z_NO_FLUSH;
    do {
        FeedInput(zs, rest, max_input);
        flush = rest.empty() ? Z_FINISH : Z_NO_FLUSH;
        do {
            zs.next_out = reinterpret_cast<Bytef*>(buf.data());
            zs.avail_out = static_cast<uInt>(buf.size());
            ret = deflate(&zs, flush);
            if (ret == Z_STREAM_ERROR) {
                Error err = ZlibError("deflate", ret, zs);
                deflateEnd(&zs);
                return std::unexpected(err);
            }
            out.append(buf.data(), buf.size() - zs.avail_out);
        } while (zs.avail_out == 0);
    } while (flush != Z_FINISH);

    deflateEnd(&zs);
    return out;
}

std::expected<std::string, Error> GzipDecompress(std::string_view data, size_t max_input) {
    max_input = std::clamp<size_t>(max_input, 1, kMaxZlibInput);

    z_stream zs{};
    int ret = inflateInit2(&zs, kGzipWindowBits);
    if (ret != Z_OK) {
        return std::unexpected(ZlibError("inflateInit2", ret, zs));
    }

    std::string out;
    std::array<char, kChunkSize> buf;
    std::string_view rest = data;
    do {
        if (zs.avail_in == 0) FeedInput(zs, rest, max_input);
        zs.next_out = reinterpret_cast<Bytef*>(buf.data());
        zs.avail_out = static_cast<uInt>(buf.size());
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            if (ret == Z_BUF_ERROR) {
                ret = Z_DATA_ERROR;  // input ended before the stream did
            }
            Error err = ZlibError("inflate", ret, zs);
            inflateEnd(&zs);
            return std::unexpected(err);
        }
        out.append(buf.data(), buf.size() - zs.avail_out);
    } while (ret != Z_STREAM_END);

    inflateEnd(&zs);
    return out;
}

}  // namespace detail

}  // namespace tsdb_pipe
