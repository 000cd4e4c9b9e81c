#include "EcpayPlugin.h"
#include "../utils/EcpayMetrics.h"
#include "../utils/EcpayUtils.h"
#include <drogon/drogon.h>
#include <cstdlib>
#include <trantor/utils/Date.h>

namespace
{
using ecpay::ErrorKind;
using ecpay::utils::getRequiredString;
using ecpay::utils::maskMerchantId;
using ecpay::utils::parseWholeAmount;

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

std::string stripTrailingSlash(std::string url)
{
    while (!url.empty() && url.back() == '/')
    {
        url.pop_back();
    }
    return url;
}

ecpay::FormParams collectFormParams(const drogon::HttpRequestPtr &req)
{
    ecpay::FormParams params;
    for (const auto &item : req->getParameters())
    {
        params[item.first] = item.second;
    }
    return params;
}

// Non-string values read as absent.
std::string optionalString(const Json::Value &json, const char *key)
{
    std::string value;
    return getRequiredString(json, key, value) ? value : std::string();
}

std::string fieldOf(const ecpay::FormParams &params, const char *key)
{
    const auto it = params.find(key);
    return it == params.end() ? std::string() : it->second;
}

drogon::HttpResponsePtr textResponse(drogon::HttpStatusCode code,
                                     const std::string &body)
{
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(code);
    resp->setContentTypeCode(drogon::CT_TEXT_PLAIN);
    resp->setBody(body);
    return resp;
}
}  // namespace

void EcpayPlugin::initAndStart(const Json::Value &config)
{
    resolver_ = std::make_shared<ecpay::CredentialResolver>(config);

    ecpay::Error error;
    callbackCredentialsReady_ =
        resolver_->resolve(nullptr, callbackCredentials_, error);
    if (callbackCredentialsReady_)
    {
        LOG_INFO << "ECPay credentials loaded: merchant="
                 << maskMerchantId(callbackCredentials_.merchantId)
                 << ", environment="
                 << ecpay::environmentName(callbackCredentials_.environment)
                 << ", deployment="
                 << ecpay::environmentName(
                        resolver_->deploymentEnvironment());
    }
    else
    {
        LOG_ERROR << "ECPay credentials unavailable: " << error.message;
    }

    publicBaseUrl_ = stripTrailingSlash(
        config.get("public_base_url", "http://localhost:3000").asString());
    returnUrl_ = envOr("ECPAY_RETURN_URL",
                       config.get("return_url", "").asString());
    if (returnUrl_.empty())
    {
        returnUrl_ = publicBaseUrl_ + "/pay/ecpay/return";
    }
    orderResultUrl_ = envOr("ECPAY_ORDER_RESULT_URL",
                            config.get("order_result_url", "").asString());
    if (orderResultUrl_.empty())
    {
        orderResultUrl_ = publicBaseUrl_ + "/pay/ecpay/result";
    }
    clientBackUrl_ = envOr("ECPAY_CLIENT_BACK_URL",
                           config.get("client_back_url", "").asString());
}

void EcpayPlugin::shutdown()
{
    resolver_.reset();
    callbackCredentialsReady_ = false;
    tradeResultHandler_ = nullptr;
}

void EcpayPlugin::setTradeResultHandler(TradeResultHandler handler)
{
    tradeResultHandler_ = std::move(handler);
}

ecpay::TradeRequest EcpayPlugin::makeTradeRequest(const std::string &tradeNo,
                                                  int64_t amount) const
{
    ecpay::TradeRequest request;
    request.tradeNumber = tradeNo;
    request.tradeTimestamp =
        ecpay::utils::formatTradeDate(trantor::Date::now());
    request.amount = amount;
    request.description = "Booking " + tradeNo;
    request.itemName = "Room booking-" + tradeNo;
    request.returnUrl = returnUrl_;
    request.resultUrl = orderResultUrl_;
    request.clientBackUrl = clientBackUrl_.empty()
                                ? publicBaseUrl_ + "/?bookingId=" + tradeNo
                                : clientBackUrl_;
    return request;
}

bool EcpayPlugin::buildPaymentForm(
    const ecpay::TradeRequest &request,
    const ecpay::CredentialSet *explicitCredentials,
    ecpay::PaymentForm &form,
    ecpay::Error &error) const
{
    if (!resolver_)
    {
        error.set(ErrorKind::kConfiguration, "ecpay plugin not initialized");
        EcpayMetrics::incFormRejected();
        return false;
    }

    ecpay::CredentialSet credentials;
    if (!resolver_->resolve(explicitCredentials, credentials, error) ||
        !ecpay::PaymentFormBuilder::build(request, credentials, form, error))
    {
        LOG_WARN << "ECPay form rejected: trade_no=" << request.tradeNumber
                 << ", reason=" << ecpay::errorKindName(error.kind) << ": "
                 << error.message;
        EcpayMetrics::incFormRejected();
        return false;
    }

    LOG_INFO << "ECPay form signed: trade_no=" << request.tradeNumber
             << ", amount=" << request.amount
             << ", merchant=" << maskMerchantId(credentials.merchantId)
             << ", environment="
             << ecpay::environmentName(credentials.environment);
    EcpayMetrics::incFormSigned();
    return true;
}

bool EcpayPlugin::verifyCallback(const ecpay::FormParams &payload,
                                 const ecpay::CredentialSet &credentials,
                                 ecpay::TradeResult &result,
                                 ecpay::Error &error) const
{
    const auto tradeNo = fieldOf(payload, "MerchantTradeNo");

    ecpay::CallbackVerifier verifier(credentials);
    ecpay::VerifiedPayload verified;
    if (!verifier.verify(payload, verified, error))
    {
        LOG_WARN << "ECPay callback rejected: trade_no=" << tradeNo
                 << ", reason=" << ecpay::errorKindName(error.kind);
        EcpayMetrics::incCallbackFailure(error.kind);
        return false;
    }

    if (!ecpay::ResultParser::parse(verified, result, error))
    {
        LOG_WARN << "ECPay callback unusable: trade_no=" << tradeNo << ", "
                 << error.message;
        EcpayMetrics::incCallbackFailure(error.kind);
        return false;
    }

    EcpayMetrics::incCallbackVerified();
    LOG_INFO << "ECPay callback verified: trade_no="
             << result.merchantTradeNumber
             << ", gateway_trade_no=" << result.gatewayTradeNumber
             << ", rtn_code=" << result.returnCode
             << ", amount=" << result.tradeAmount
             << (result.simulatePaid ? ", simulated" : "");
    return true;
}

bool EcpayPlugin::processCallback(const ecpay::FormParams &payload,
                                  ecpay::TradeResult &result,
                                  ecpay::Error &error) const
{
    if (!callbackCredentialsReady_)
    {
        error.set(ErrorKind::kConfiguration,
                  "ecpay credentials not configured");
        return false;
    }
    if (!verifyCallback(payload, callbackCredentials_, result, error))
    {
        return false;
    }
    if (result.isPaid() && tradeResultHandler_)
    {
        tradeResultHandler_(result);
    }
    return true;
}

void EcpayPlugin::createPaymentForm(
    const drogon::HttpRequestPtr &req,
    std::function<void(const drogon::HttpResponsePtr &)> &&callback)
{
    auto json = req->getJsonObject();
    if (!json)
    {
        callback(textResponse(drogon::k400BadRequest, "invalid json"));
        return;
    }

    std::string tradeNo;
    std::string amount;
    if (!getRequiredString(*json, "trade_no", tradeNo) ||
        !getRequiredString(*json, "amount", amount))
    {
        callback(textResponse(drogon::k400BadRequest,
                              "missing trade_no/amount"));
        return;
    }

    int64_t amountValue = 0;
    if (!parseWholeAmount(amount, amountValue))
    {
        LOG_WARN << "ECPay form rejected: trade_no=" << tradeNo
                 << ", reason=validation: invalid amount " << amount;
        EcpayMetrics::incFormRejected();
        callback(textResponse(drogon::k400BadRequest,
                              "amount must be a non-negative whole number"));
        return;
    }

    auto request = makeTradeRequest(tradeNo, amountValue);
    std::string value;
    if (getRequiredString(*json, "description", value))
    {
        request.description = value;
    }
    if (getRequiredString(*json, "item_name", value))
    {
        request.itemName = value;
    }
    request.customerName = optionalString(*json, "customer_name");
    request.customerEmail = optionalString(*json, "customer_email");
    request.customerPhone = optionalString(*json, "customer_phone");

    ecpay::PaymentForm form;
    ecpay::Error error;
    if (!buildPaymentForm(request, nullptr, form, error))
    {
        const auto code = error.kind == ErrorKind::kValidation
                              ? drogon::k400BadRequest
                              : drogon::k503ServiceUnavailable;
        callback(textResponse(code, error.message));
        return;
    }

    Json::Value body;
    body["action_url"] = form.actionUrl;
    body["params"] = Json::objectValue;
    for (const auto &item : form.params)
    {
        body["params"][item.first] = item.second;
    }
    callback(drogon::HttpResponse::newHttpJsonResponse(body));
}

void EcpayPlugin::handleReturnCallback(
    const drogon::HttpRequestPtr &req,
    std::function<void(const drogon::HttpResponsePtr &)> &&callback)
{
    ecpay::TradeResult result;
    ecpay::Error error;
    if (!processCallback(collectFormParams(req), result, error))
    {
        const auto code = error.kind == ErrorKind::kConfiguration
                              ? drogon::k503ServiceUnavailable
                              : drogon::k400BadRequest;
        callback(textResponse(code, "0|" + error.message));
        return;
    }

    // The gateway keeps retrying until it reads exactly this body.
    callback(textResponse(drogon::k200OK, "1|OK"));
}

void EcpayPlugin::handleResultRedirect(
    const drogon::HttpRequestPtr &req,
    std::function<void(const drogon::HttpResponsePtr &)> &&callback)
{
    const auto payload = collectFormParams(req);

    Json::Value body;
    body["trade_no"] = fieldOf(payload, "MerchantTradeNo");

    ecpay::TradeResult result;
    ecpay::Error error;
    if (!processCallback(payload, result, error))
    {
        body["status"] = "rejected";
        body["reason"] = ecpay::errorKindName(error.kind);
        auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
        resp->setStatusCode(error.kind == ErrorKind::kConfiguration
                                ? drogon::k503ServiceUnavailable
                                : drogon::k400BadRequest);
        callback(resp);
        return;
    }

    body["status"] = result.isPaid() ? "paid" : "unpaid";
    body["rtn_code"] = result.returnCode;
    body["rtn_msg"] = result.returnMessage;
    body["amount"] = static_cast<Json::Int64>(result.tradeAmount);
    callback(drogon::HttpResponse::newHttpJsonResponse(body));
}
