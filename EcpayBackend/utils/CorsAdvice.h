#pragma once

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <string>

namespace ecpay::utils
{
// Origins are listed under custom_config.cors.allow_origins.
bool isOriginAllowed(const Json::Value &customConfig, const std::string &origin);

// Answers a preflight from an allowed origin; nullptr lets the request
// through to its handler.
drogon::HttpResponsePtr makePreflightResponse(
    const drogon::HttpRequestPtr &req,
    const Json::Value &customConfig);

void addCorsHeaders(const drogon::HttpRequestPtr &req,
                    const drogon::HttpResponsePtr &resp,
                    const Json::Value &customConfig);

// Registers the preflight and response advices on drogon::app().
void setupCors();
}  // namespace ecpay::utils
