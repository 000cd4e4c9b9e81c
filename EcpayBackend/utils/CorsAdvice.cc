#include "CorsAdvice.h"
#include <drogon/drogon.h>

namespace ecpay::utils
{
bool isOriginAllowed(const Json::Value &customConfig, const std::string &origin)
{
    if (origin.empty())
        return false;

    const auto &allowOrigins = customConfig["cors"]["allow_origins"];
    if (allowOrigins.isArray())
    {
        for (const auto &allowed : allowOrigins)
        {
            if (allowed.isString() && allowed.asString() == origin)
                return true;
        }
    }
    return false;
}

drogon::HttpResponsePtr makePreflightResponse(
    const drogon::HttpRequestPtr &req,
    const Json::Value &customConfig)
{
    if (req->method() != drogon::Options)
    {
        return {};
    }
    const auto &origin = req->getHeader("Origin");
    if (!isOriginAllowed(customConfig, origin))
    {
        return {};
    }

    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->addHeader("Access-Control-Allow-Origin", origin);

    const auto &requestMethod = req->getHeader("Access-Control-Request-Method");
    if (!requestMethod.empty())
    {
        resp->addHeader("Access-Control-Allow-Methods", requestMethod);
    }

    resp->addHeader("Access-Control-Allow-Credentials", "true");

    const auto &requestHeaders =
        req->getHeader("Access-Control-Request-Headers");
    if (!requestHeaders.empty())
    {
        resp->addHeader("Access-Control-Allow-Headers", requestHeaders);
    }
    return resp;
}

void addCorsHeaders(const drogon::HttpRequestPtr &req,
                    const drogon::HttpResponsePtr &resp,
                    const Json::Value &customConfig)
{
    const auto &origin = req->getHeader("Origin");
    if (!isOriginAllowed(customConfig, origin))
    {
        return;
    }
    resp->addHeader("Access-Control-Allow-Origin", origin);
    resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    resp->addHeader("Access-Control-Allow-Headers",
                    "Content-Type, Authorization, X-Api-Key");
    resp->addHeader("Access-Control-Allow-Credentials", "true");
}

void setupCors()
{
    drogon::app().registerSyncAdvice(
        [](const drogon::HttpRequestPtr &req) -> drogon::HttpResponsePtr {
            return makePreflightResponse(req, drogon::app().getCustomConfig());
        });

    drogon::app().registerPostHandlingAdvice(
        [](const drogon::HttpRequestPtr &req,
           const drogon::HttpResponsePtr &resp) {
            addCorsHeaders(req, resp, drogon::app().getCustomConfig());
        });
}
}  // namespace ecpay::utils
