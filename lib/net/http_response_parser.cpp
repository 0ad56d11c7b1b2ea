// SPDX-License-Identifier: MIT

// lib/net/http_response_parser.cpp
#include "lib/net/http_response_parser.hpp"

#include <cctype>
#include <utility>

namespace tsdb_pipe {

HttpResponseParser::HttpResponseParser() {
    llhttp_settings_init(&settings_);
    settings_.on_message_begin = OnMessageBegin;
    settings_.on_header_field = OnHeaderField;
    settings_.on_header_value = OnHeaderValue;
    settings_.on_headers_complete = OnHeadersComplete;
    settings_.on_body = OnBody;
    settings_.on_message_complete = OnMessageComplete;

    llhttp_init(&parser_, HTTP_RESPONSE, &settings_);
    parser_.data = this;
}

std::expected<bool, Error> HttpResponseParser::Feed(std::string_view data) {
    if (message_complete_) return true;
    if (data.empty()) return false;

    auto err = llhttp_execute(&parser_, data.data(), data.size());
    if (err == HPE_PAUSED) {
        // Paused by OnMessageComplete; trailing bytes belong to the next response
        return true;
    }
    if (overflow_) {
        return std::unexpected(Error{ErrorCode::BufferOverflow,
            "HTTP response body exceeds " + std::to_string(kMaxBody) + " bytes"});
    }
    if (err != HPE_OK) {
        std::string msg = llhttp_errno_name(err);
        if (const char* reason = llhttp_get_error_reason(&parser_)) {
            msg += ": ";
            msg += reason;
        }
        return std::unexpected(Error{ErrorCode::HttpError, std::move(msg)});
    }
    return message_complete_;
}

std::expected<void, Error> HttpResponseParser::Finish() {
    if (message_complete_) return {};
    if (!started_) {
        return std::unexpected(Error{ErrorCode::ConnectionClosed,
            "connection closed before response"});
    }

    // HPE_OK without OnMessageComplete is fine for close-delimited responses
    auto err = llhttp_finish(&parser_);
    if (err != HPE_OK && err != HPE_PAUSED) {
        return std::unexpected(Error{ErrorCode::ConnectionClosed,
            std::string("connection closed mid-response: ") + llhttp_errno_name(err)});
    }
    if (!message_complete_) {
        return std::unexpected(Error{ErrorCode::ConnectionClosed,
            "connection closed mid-response"});
    }
    keep_alive_ = false;
    return {};
}

HttpResponse HttpResponseParser::TakeResponse() {
    return std::exchange(response_, HttpResponse{});
}

void HttpResponseParser::Reset() {
    response_ = HttpResponse{};
    started_ = false;
    message_complete_ = false;
    keep_alive_ = false;
    overflow_ = false;
    header_state_ = HeaderState::None;
    current_header_field_.clear();
    current_header_value_.clear();

    llhttp_init(&parser_, HTTP_RESPONSE, &settings_);
    parser_.data = this;
}

void HttpResponseParser::ProcessHeader() {
    response_.headers.emplace_back(std::move(current_header_field_),
                                   std::move(current_header_value_));
    current_header_field_.clear();
    current_header_value_.clear();
}

int HttpResponseParser::OnMessageBegin(llhttp_t* parser) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);
    self->started_ = true;
    return 0;
}

int HttpResponseParser::OnHeaderField(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);

    if (self->header_state_ == HeaderState::Value) {
        self->ProcessHeader();
    }

    if (self->header_state_ == HeaderState::Field) {
        self->current_header_field_.append(at, len);
    } else {
        self->current_header_field_.assign(at, len);
    }
    self->header_state_ = HeaderState::Field;

    for (char& c : self->current_header_field_) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return 0;
}

int HttpResponseParser::OnHeaderValue(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);

    if (self->header_state_ == HeaderState::Value) {
        self->current_header_value_.append(at, len);
    } else {
        self->current_header_value_.assign(at, len);
    }
    self->header_state_ = HeaderState::Value;
    return 0;
}

int HttpResponseParser::OnHeadersComplete(llhttp_t* parser) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);

    if (self->header_state_ == HeaderState::Value) {
        self->ProcessHeader();
    }
    self->header_state_ = HeaderState::None;
    self->response_.status_code = static_cast<int>(parser->status_code);
    return 0;
}

int HttpResponseParser::OnBody(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);
    if (len > kMaxBody - self->response_.body.size()) {
        self->overflow_ = true;
        return -1;
    }
    self->response_.body.append(at, len);
    return 0;
}

int HttpResponseParser::OnMessageComplete(llhttp_t* parser) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);
    self->message_complete_ = true;
    self->keep_alive_ = llhttp_should_keep_alive(parser) != 0;
    return HPE_PAUSED;
}

}  // namespace tsdb_pipe
