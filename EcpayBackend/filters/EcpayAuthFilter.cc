#include "EcpayAuthFilter.h"
#include "../utils/EcpayMetrics.h"
#include <drogon/drogon.h>
#include <openssl/crypto.h>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace
{
std::string trim(const std::string &value)
{
    const auto start = value.find_first_not_of(" \t");
    if (start == std::string::npos)
    {
        return {};
    }
    const auto end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

std::vector<std::string> splitKeys(const std::string &value)
{
    std::vector<std::string> keys;
    std::stringstream ss(value);
    std::string token;
    while (std::getline(ss, token, ','))
    {
        auto key = trim(token);
        if (!key.empty())
        {
            keys.push_back(key);
        }
    }
    return keys;
}

std::vector<std::string> loadAllowedKeys()
{
    std::vector<std::string> allowedKeys;
    const auto &customConfig = drogon::app().getCustomConfig();
    const auto &configured = customConfig["ecpay"]["api_keys"];
    if (configured.isArray())
    {
        for (const auto &item : configured)
        {
            auto key = item.asString();
            if (!key.empty())
            {
                allowedKeys.push_back(key);
            }
        }
    }

    if (const char *singleKey = std::getenv("ECPAY_API_KEY"))
    {
        auto key = trim(singleKey);
        if (!key.empty())
        {
            allowedKeys.push_back(key);
        }
    }

    if (const char *multiKeys = std::getenv("ECPAY_API_KEYS"))
    {
        const auto extra = splitKeys(multiKeys);
        allowedKeys.insert(allowedKeys.end(), extra.begin(), extra.end());
    }
    return allowedKeys;
}

std::string extractApiKey(const drogon::HttpRequestPtr &req)
{
    auto key = req->getHeader("X-Api-Key");
    if (!key.empty())
    {
        return key;
    }

    const auto auth = req->getHeader("Authorization");
    const std::string bearer = "Bearer ";
    if (auth.rfind(bearer, 0) == 0 && auth.size() > bearer.size())
    {
        return auth.substr(bearer.size());
    }
    return auth;
}

bool keyMatches(const std::vector<std::string> &allowedKeys,
                const std::string &key)
{
    bool match = false;
    for (const auto &allowed : allowedKeys)
    {
        if (allowed.size() == key.size() &&
            CRYPTO_memcmp(allowed.data(), key.data(), key.size()) == 0)
        {
            match = true;
        }
    }
    return match;
}

drogon::HttpResponsePtr reject(drogon::HttpStatusCode code,
                               const std::string &body)
{
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(code);
    resp->setBody(body);
    return resp;
}
}  // namespace

void EcpayAuthFilter::doFilter(const drogon::HttpRequestPtr &req,
                               drogon::FilterCallback &&fcb,
                               drogon::FilterChainCallback &&fccb)
{
    if (req->method() == drogon::Options)
    {
        fccb();
        return;
    }

    const auto allowedKeys = loadAllowedKeys();
    if (allowedKeys.empty())
    {
        LOG_WARN << "EcpayAuthFilter: api key not configured";
        EcpayMetrics::incAuthNotConfigured();
        fcb(reject(drogon::k503ServiceUnavailable, "api key not configured"));
        return;
    }

    const auto key = extractApiKey(req);
    if (key.empty())
    {
        LOG_WARN << "EcpayAuthFilter: missing api key";
        EcpayMetrics::incAuthMissingKey();
        fcb(reject(drogon::k401Unauthorized, "missing api key"));
        return;
    }

    if (!keyMatches(allowedKeys, key))
    {
        LOG_WARN << "EcpayAuthFilter: invalid api key";
        EcpayMetrics::incAuthInvalidKey();
        fcb(reject(drogon::k401Unauthorized, "invalid api key"));
        return;
    }

    fccb();
}
