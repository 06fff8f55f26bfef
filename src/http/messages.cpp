#include "http/messages.hpp"
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::http {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
void Request::toJson(Json::Value& object) const
// Encode as payload object
{
    object["method"] = method;
    object["path"] = path;
    object["queryString"] = queryString;
    codec::writeStringMap(object, "header", header);
    codec::writeBytes(object, "body", body);
}
//---------------------------------------------------------------------------
void Request::fromJson(const Json::Value& object)
// Decode from payload object
{
    method = codec::readString(object, "method");
    path = codec::readString(object, "path");
    queryString = codec::readString(object, "queryString");
    header = codec::readStringMap(object, "header");
    body = codec::readBytes(object, "body");
}
//---------------------------------------------------------------------------
Response Response::ok()
// 200 OK
{
    Response response;
    response.statusCode = 200;
    response.status = "OK";
    return response;
}
//---------------------------------------------------------------------------
Response Response::notFound()
// 404 Not Found
{
    Response response;
    response.statusCode = 404;
    response.status = "Not Found";
    return response;
}
//---------------------------------------------------------------------------
Response Response::badRequest()
// 400 Bad Request
{
    Response response;
    response.statusCode = 400;
    response.status = "Bad Request";
    return response;
}
//---------------------------------------------------------------------------
Response Response::internalServerError(string_view message)
// 500 with the message as body
{
    Response response;
    response.statusCode = 500;
    response.status = "Internal Server Error";
    response.body.assign(message.begin(), message.end());
    return response;
}
//---------------------------------------------------------------------------
void Response::toJson(Json::Value& object) const
// Encode as payload object
{
    object["statusCode"] = Json::UInt(statusCode);
    object["status"] = status;
    codec::writeStringMap(object, "header", header);
    codec::writeBytes(object, "body", body);
}
//---------------------------------------------------------------------------
void Response::fromJson(const Json::Value& object)
// Decode from payload object
{
    statusCode = codec::readUInt32(object, "statusCode");
    status = codec::readString(object, "status");
    header = codec::readStringMap(object, "header");
    body = codec::readBytes(object, "body");
}
//---------------------------------------------------------------------------
} // namespace caplink::http
