#pragma once
#include "codec/codec.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::http {
//---------------------------------------------------------------------------
/// An http request, inbound for HandleRequest and outbound for PerformRequest
struct Request {
    /// The method (GET, PUT, DELETE, ...)
    std::string method;
    /// The path or url, leading slashes are kept
    std::string path;
    /// The query string without '?'
    std::string queryString;
    /// The headers
    std::unordered_map<std::string, std::string> header;
    /// The body
    std::vector<uint8_t> body;

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
/// An http response
struct Response {
    /// The status code
    uint32_t statusCode = 0;
    /// The status text
    std::string status;
    /// The headers
    std::unordered_map<std::string, std::string> header;
    /// The body
    std::vector<uint8_t> body;

    /// 200 OK without body
    [[nodiscard]] static Response ok();
    /// 404 Not Found
    [[nodiscard]] static Response notFound();
    /// 400 Bad Request
    [[nodiscard]] static Response badRequest();
    /// 500 Internal Server Error with the message as body
    [[nodiscard]] static Response internalServerError(std::string_view message);
    /// A response whose body is the encoded message
    template <typename T>
    [[nodiscard]] static Response json(const T& message, uint32_t statusCode, std::string status) {
        Response response;
        response.statusCode = statusCode;
        response.status = std::move(status);
        response.body = codec::serialize(message);
        return response;
    }

    /// Encode as payload object
    void toJson(Json::Value& object) const;
    /// Decode from payload object
    void fromJson(const Json::Value& object);
};
//---------------------------------------------------------------------------
} // namespace caplink::http
