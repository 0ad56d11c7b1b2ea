// SPDX-License-Identifier: MIT

// lib/net/json_parser.hpp
#pragma once

#include <concepts>
#include <expected>
#include <string>
#include <string_view>

#include <rapidjson/error/en.h>
#include <rapidjson/reader.h>
#include <rapidjson/stream.h>

namespace tsdb_pipe {

// Builder concept - types that can incrementally build a result from JSON events
//
// Numbers are delivered as their source text through OnNumber() so that large
// integers and long decimals are never rounded through double.
template <typename B>
concept JsonBuilder = requires(B& b, std::string_view sv, bool bl) {
    typename B::Result;
    { b.OnKey(sv) } -> std::same_as<void>;
    { b.OnString(sv) } -> std::same_as<void>;
    { b.OnNumber(sv) } -> std::same_as<void>;
    { b.OnBool(bl) } -> std::same_as<void>;
    { b.OnNull() } -> std::same_as<void>;
    { b.OnStartObject() } -> std::same_as<void>;
    { b.OnEndObject() } -> std::same_as<void>;
    { b.OnStartArray() } -> std::same_as<void>;
    { b.OnEndArray() } -> std::same_as<void>;
    { b.Build() } -> std::same_as<std::expected<typename B::Result, std::string>>;
};

enum class JsonErrorKind {
    EmptyDocument,  // input held no value at all (empty or whitespace only)
    Syntax,         // malformed or truncated JSON
    Build,          // JSON was valid but the builder rejected its shape
};

struct JsonError {
    JsonErrorKind kind;
    std::string message;
};

namespace detail {

// RapidJSON SAX handler that forwards to Builder
template <JsonBuilder Builder>
struct SaxHandler : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, SaxHandler<Builder>> {
    Builder& builder;

    explicit SaxHandler(Builder& b) : builder(b) {}

    bool Null() {
        builder.OnNull();
        return true;
    }
    bool Bool(bool b) {
        builder.OnBool(b);
        return true;
    }
    // Only reached with kParseNumbersAsStringsFlag
    bool RawNumber(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        builder.OnNumber(std::string_view(str, length));
        return true;
    }
    bool String(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        builder.OnString(std::string_view(str, length));
        return true;
    }
    bool Key(const char* str, rapidjson::SizeType length, bool /*copy*/) {
        builder.OnKey(std::string_view(str, length));
        return true;
    }
    bool StartObject() {
        builder.OnStartObject();
        return true;
    }
    bool EndObject(rapidjson::SizeType /*memberCount*/) {
        builder.OnEndObject();
        return true;
    }
    bool StartArray() {
        builder.OnStartArray();
        return true;
    }
    bool EndArray(rapidjson::SizeType /*elementCount*/) {
        builder.OnEndArray();
        return true;
    }
};

}  // namespace detail

// Parse one JSON document and build a result from it.
//
// Parsing stops after the first complete value; trailing bytes are ignored,
// matching a streaming decoder that reads a single value from a body.
template <JsonBuilder Builder>
std::expected<typename Builder::Result, JsonError> ParseJson(std::string_view json,
                                                             Builder& builder) {
    constexpr unsigned kFlags =
        rapidjson::kParseNumbersAsStringsFlag | rapidjson::kParseStopWhenDoneFlag;

    // Ensure null-termination for rapidjson::StringStream
    std::string buffer(json);

    detail::SaxHandler<Builder> handler(builder);
    rapidjson::Reader reader;
    rapidjson::StringStream stream(buffer.c_str());

    auto result = reader.Parse<kFlags>(stream, handler);
    if (result.IsError()) {
        if (result.Code() == rapidjson::kParseErrorDocumentEmpty) {
            return std::unexpected(JsonError{JsonErrorKind::EmptyDocument, "EOF"});
        }
        return std::unexpected(JsonError{JsonErrorKind::Syntax,
            std::string("Parse error at offset ") + std::to_string(result.Offset()) +
            ": " + rapidjson::GetParseError_En(result.Code())});
    }

    auto built = builder.Build();
    if (!built) {
        return std::unexpected(JsonError{JsonErrorKind::Build, std::move(built.error())});
    }
    return std::move(*built);
}

}  // namespace tsdb_pipe
