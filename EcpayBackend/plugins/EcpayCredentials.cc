#include "EcpayCredentials.h"
#include "../utils/EcpayUtils.h"
#include <drogon/drogon.h>
#include <cstdlib>

namespace
{
std::string envOr(const char *name, const std::string &fallback)
{
    if (const char *value = std::getenv(name))
    {
        if (*value)
        {
            return value;
        }
    }
    return fallback;
}

std::string joinNames(const std::vector<std::string> &names)
{
    std::string joined;
    for (const auto &name : names)
    {
        if (!joined.empty())
        {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}
}  // namespace

namespace ecpay
{
const char *gatewayUrlFor(Environment environment)
{
    return environment == Environment::kProduction ? kProductionGatewayUrl
                                                   : kTestGatewayUrl;
}

const char *environmentName(Environment environment)
{
    return environment == Environment::kProduction ? "production" : "test";
}

bool parseEnvironment(const std::string &value, Environment &environment)
{
    if (value == "test")
    {
        environment = Environment::kTest;
        return true;
    }
    if (value == "production")
    {
        environment = Environment::kProduction;
        return true;
    }
    return false;
}

std::vector<std::string> missingCredentialFields(
    const CredentialSet &credentials)
{
    std::vector<std::string> missing;
    if (credentials.merchantId.empty())
    {
        missing.emplace_back("MerchantID");
    }
    if (credentials.hashKey.empty())
    {
        missing.emplace_back("HashKey");
    }
    if (credentials.hashIv.empty())
    {
        missing.emplace_back("HashIV");
    }
    return missing;
}

CredentialResolver::CredentialResolver(const Json::Value &config)
{
    const auto &ecpayConfig = config["ecpay"];

    const auto deployment = envOr(
        "ECPAY_DEPLOYMENT_ENV",
        config.get("deployment_environment", "test").asString());
    if (!parseEnvironment(deployment, deployment_))
    {
        configError_ = "unknown deployment_environment: " + deployment;
    }

    const auto environment =
        envOr("ECPAY_ENVIRONMENT",
              ecpayConfig.get("environment", "test").asString());
    if (!parseEnvironment(environment, defaults_.environment))
    {
        if (!configError_.empty())
        {
            configError_ += "; ";
        }
        configError_ += "unknown ecpay environment: " + environment;
    }

    defaults_.merchantId = envOr(
        "ECPAY_MERCHANT_ID", ecpayConfig.get("merchant_id", "").asString());
    defaults_.hashKey =
        envOr("ECPAY_HASH_KEY", ecpayConfig.get("hash_key", "").asString());
    defaults_.hashIv =
        envOr("ECPAY_HASH_IV", ecpayConfig.get("hash_iv", "").asString());
    defaults_.gatewayUrl = gatewayUrlFor(defaults_.environment);
}

CredentialResolver::CredentialResolver(const CredentialSet &defaults,
                                       Environment deploymentEnvironment)
    : defaults_(defaults), deployment_(deploymentEnvironment)
{
    defaults_.gatewayUrl = gatewayUrlFor(defaults_.environment);
}

bool CredentialResolver::resolve(const CredentialSet *explicitCredentials,
                                 CredentialSet &credentials,
                                 Error &error) const
{
    if (!explicitCredentials && !configError_.empty())
    {
        error.set(ErrorKind::kConfiguration, configError_);
        return false;
    }

    CredentialSet candidate =
        explicitCredentials ? *explicitCredentials : defaults_;

    const auto missing = missingCredentialFields(candidate);
    if (!missing.empty())
    {
        error.set(ErrorKind::kConfiguration,
                  "incomplete ecpay credentials, missing: " +
                      joinNames(missing));
        return false;
    }

    if (candidate.environment == Environment::kProduction &&
        deployment_ != Environment::kProduction)
    {
        error.set(ErrorKind::kConfiguration,
                  "production credentials refused outside a production "
                  "deployment");
        return false;
    }
    if (candidate.environment == Environment::kTest &&
        deployment_ == Environment::kProduction)
    {
        LOG_WARN << "ECPay test credentials in production deployment, "
                    "merchant="
                 << utils::maskMerchantId(candidate.merchantId)
                 << ", payments go to the staging gateway";
    }

    candidate.gatewayUrl = gatewayUrlFor(candidate.environment);
    credentials = candidate;
    return true;
}
}  // namespace ecpay
