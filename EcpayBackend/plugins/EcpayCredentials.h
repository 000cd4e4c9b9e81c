#pragma once

#include <json/json.h>
#include <string>
#include <vector>
#include "EcpayTypes.h"
#include "../utils/EcpayError.h"

namespace ecpay
{
constexpr const char *kTestGatewayUrl =
    "https://payment-stage.ecpay.com.tw/Cashier/AioCheckOut/V5";
constexpr const char *kProductionGatewayUrl =
    "https://payment.ecpay.com.tw/Cashier/AioCheckOut/V5";

const char *gatewayUrlFor(Environment environment);
const char *environmentName(Environment environment);
bool parseEnvironment(const std::string &value, Environment &environment);

// Names of the wire fields a credential set is missing, empty when complete.
std::vector<std::string> missingCredentialFields(
    const CredentialSet &credentials);

/**
 * Holds the merchant credentials loaded from configuration and hands out
 * the CredentialSet used to sign or verify one transaction.
 *
 * Configuration keys (plugin config block):
 *   deployment_environment  "test" | "production"
 *   ecpay.environment       "test" | "production"
 *   ecpay.merchant_id / ecpay.hash_key / ecpay.hash_iv
 * Non-empty ECPAY_DEPLOYMENT_ENV, ECPAY_ENVIRONMENT, ECPAY_MERCHANT_ID,
 * ECPAY_HASH_KEY and ECPAY_HASH_IV environment variables take precedence.
 *
 * A production credential set is only handed out when the deployment is
 * production as well.
 */
class CredentialResolver
{
  public:
    explicit CredentialResolver(const Json::Value &config);
    CredentialResolver(const CredentialSet &defaults,
                       Environment deploymentEnvironment);

    bool resolve(const CredentialSet *explicitCredentials,
                 CredentialSet &credentials,
                 Error &error) const;

    Environment deploymentEnvironment() const { return deployment_; }

  private:
    CredentialSet defaults_;
    Environment deployment_{Environment::kTest};
    std::string configError_;
};
}  // namespace ecpay
