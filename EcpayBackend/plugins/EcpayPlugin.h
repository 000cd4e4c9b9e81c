#pragma once

#include <drogon/plugins/Plugin.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <functional>
#include <memory>
#include <string>
#include "EcpayCallback.h"
#include "EcpayCredentials.h"
#include "EcpayPaymentForm.h"
#include "EcpayTypes.h"

class EcpayPlugin : public drogon::Plugin<EcpayPlugin>
{
  public:
    // Receives every verified, paid trade. Both the server callback and the
    // browser redirect report the same trade, so handlers must be idempotent.
    using TradeResultHandler = std::function<void(const ecpay::TradeResult &)>;

    EcpayPlugin() = default;
    void initAndStart(const Json::Value &config) override;
    void shutdown() override;

    void createPaymentForm(
        const drogon::HttpRequestPtr &req,
        std::function<void(const drogon::HttpResponsePtr &)> &&callback);

    // Gateway server-to-server notification (ReturnURL).
    void handleReturnCallback(
        const drogon::HttpRequestPtr &req,
        std::function<void(const drogon::HttpResponsePtr &)> &&callback);

    // Browser redirect after checkout (OrderResultURL).
    void handleResultRedirect(
        const drogon::HttpRequestPtr &req,
        std::function<void(const drogon::HttpResponsePtr &)> &&callback);

    bool buildPaymentForm(const ecpay::TradeRequest &request,
                          const ecpay::CredentialSet *explicitCredentials,
                          ecpay::PaymentForm &form,
                          ecpay::Error &error) const;

    bool verifyCallback(const ecpay::FormParams &payload,
                        const ecpay::CredentialSet &credentials,
                        ecpay::TradeResult &result,
                        ecpay::Error &error) const;

    // Must be set before the application starts serving.
    void setTradeResultHandler(TradeResultHandler handler);

    ecpay::TradeRequest makeTradeRequest(const std::string &tradeNo,
                                         int64_t amount) const;

  private:
    bool processCallback(const ecpay::FormParams &payload,
                         ecpay::TradeResult &result,
                         ecpay::Error &error) const;

    std::shared_ptr<ecpay::CredentialResolver> resolver_;
    ecpay::CredentialSet callbackCredentials_;
    bool callbackCredentialsReady_{false};
    std::string publicBaseUrl_;
    std::string returnUrl_;
    std::string orderResultUrl_;
    std::string clientBackUrl_;
    TradeResultHandler tradeResultHandler_;
};
