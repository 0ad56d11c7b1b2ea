// SPDX-License-Identifier: MIT

// lib/net/http_response_parser.hpp
#pragma once

#include <llhttp.h>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "lib/net/error.hpp"
#include "lib/net/http_message.hpp"

namespace tsdb_pipe {

// HttpResponseParser parses one HTTP/1.1 response at a time using llhttp.
//
// Bytes are fed as they arrive from the socket. Feed() returns true once the
// message is complete; the parser pauses there so pipelined bytes are not
// consumed. Finish() handles close-delimited bodies at EOF.
//
// Not thread-safe; one parser per connection.
class HttpResponseParser {
public:
    HttpResponseParser();

    HttpResponseParser(const HttpResponseParser&) = delete;
    HttpResponseParser& operator=(const HttpResponseParser&) = delete;

    // Feed received bytes. Returns true when the response is complete.
    std::expected<bool, Error> Feed(std::string_view data);

    // Signal EOF from the peer. Completes close-delimited responses.
    std::expected<void, Error> Finish();

    bool IsMessageComplete() const { return message_complete_; }
    bool HasStarted() const { return started_; }

    // True when the peer allows reusing the connection for the next request
    bool ShouldKeepAlive() const { return keep_alive_; }

    int StatusCode() const { return response_.status_code; }

    // Move the parsed response out. Only valid after completion.
    HttpResponse TakeResponse();

    // Prepare for the next response on the same connection
    void Reset();

private:
    static int OnMessageBegin(llhttp_t* parser);
    static int OnHeaderField(llhttp_t* parser, const char* at, size_t len);
    static int OnHeaderValue(llhttp_t* parser, const char* at, size_t len);
    static int OnHeadersComplete(llhttp_t* parser);
    static int OnBody(llhttp_t* parser, const char* at, size_t len);
    static int OnMessageComplete(llhttp_t* parser);

    void ProcessHeader();

    llhttp_t parser_;
    llhttp_settings_t settings_;

    HttpResponse response_;
    bool started_ = false;
    bool message_complete_ = false;
    bool keep_alive_ = false;
    bool overflow_ = false;

    // llhttp may split headers across multiple callbacks, so we accumulate
    enum class HeaderState { None, Field, Value };
    HeaderState header_state_ = HeaderState::None;
    std::string current_header_field_;
    std::string current_header_value_;

    static constexpr size_t kMaxBody = 64 * 1024 * 1024;  // 64MB
};

}  // namespace tsdb_pipe
