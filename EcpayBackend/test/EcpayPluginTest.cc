#include <drogon/drogon_test.h>
#include "../plugins/CheckMacValue.h"
#include "../plugins/EcpayPlugin.h"
#include "../utils/EcpayMetrics.h"
#include <cstdlib>
#include <vector>

namespace
{
void clearEcpayEnv()
{
    for (const char *name : {"ECPAY_DEPLOYMENT_ENV",
                             "ECPAY_ENVIRONMENT",
                             "ECPAY_MERCHANT_ID",
                             "ECPAY_HASH_KEY",
                             "ECPAY_HASH_IV",
                             "ECPAY_RETURN_URL",
                             "ECPAY_ORDER_RESULT_URL",
                             "ECPAY_CLIENT_BACK_URL"})
    {
#ifdef _WIN32
        _putenv_s(name, "");
#else
        unsetenv(name);
#endif
    }
}

Json::Value pluginConfig()
{
    Json::Value config;
    config["deployment_environment"] = "test";
    config["ecpay"]["environment"] = "test";
    config["ecpay"]["merchant_id"] = "2000132";
    config["ecpay"]["hash_key"] = "5294y06JbISpM5x9";
    config["ecpay"]["hash_iv"] = "v77hoKGq4kWxNNIS";
    config["public_base_url"] = "https://hotel.example.com/";
    return config;
}

ecpay::CredentialSet testCredentials()
{
    ecpay::CredentialSet credentials;
    credentials.merchantId = "2000132";
    credentials.hashKey = "5294y06JbISpM5x9";
    credentials.hashIv = "v77hoKGq4kWxNNIS";
    return credentials;
}

ecpay::FormParams paidNotification(const std::string &tradeNo)
{
    ecpay::FormParams payload = {{"MerchantID", "2000132"},
                                 {"MerchantTradeNo", tradeNo},
                                 {"PaymentDate", "2026/10/18 14:05:11"},
                                 {"PaymentType", "Credit_CreditCard"},
                                 {"PaymentTypeChargeFee", "165"},
                                 {"RtnCode", "1"},
                                 {"RtnMsg", "Succeeded"},
                                 {"SimulatePaid", "0"},
                                 {"TradeAmt", "6000"},
                                 {"TradeDate", "2026/10/18 14:03:27"},
                                 {"TradeNo", "2610181403271234"}};
    payload["CheckMacValue"] =
        ecpay::computeCheckMacValue(payload, testCredentials());
    return payload;
}

drogon::HttpRequestPtr formRequest(drogon::HttpMethod method,
                                   const ecpay::FormParams &params)
{
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(method);
    for (const auto &item : params)
    {
        req->setParameter(item.first, item.second);
    }
    return req;
}

template <typename Handler>
drogon::HttpResponsePtr run(Handler handler, const drogon::HttpRequestPtr &req)
{
    drogon::HttpResponsePtr response;
    handler(req, [&response](const drogon::HttpResponsePtr &resp) {
        response = resp;
    });
    return response;
}

drogon::HttpResponsePtr runCreate(EcpayPlugin &plugin, const Json::Value &body)
{
    return run(
        [&plugin](const drogon::HttpRequestPtr &req, auto &&cb) {
            plugin.createPaymentForm(req, std::move(cb));
        },
        drogon::HttpRequest::newHttpJsonRequest(body));
}

drogon::HttpResponsePtr runReturn(EcpayPlugin &plugin,
                                  const ecpay::FormParams &params)
{
    return run(
        [&plugin](const drogon::HttpRequestPtr &req, auto &&cb) {
            plugin.handleReturnCallback(req, std::move(cb));
        },
        formRequest(drogon::Post, params));
}

drogon::HttpResponsePtr runResult(EcpayPlugin &plugin,
                                  const ecpay::FormParams &params)
{
    return run(
        [&plugin](const drogon::HttpRequestPtr &req, auto &&cb) {
            plugin.handleResultRedirect(req, std::move(cb));
        },
        formRequest(drogon::Get, params));
}
}  // namespace

DROGON_TEST(EcpayPlugin_CreatePaymentForm)
{
    clearEcpayEnv();
    EcpayPlugin plugin;
    plugin.initAndStart(pluginConfig());

    Json::Value body;
    body["trade_no"] = "BK17605123456";
    body["amount"] = 6000;
    body["customer_name"] = "Lin Mei";
    body["customer_email"] = "mei@example.com";
    body["customer_phone"] = "0912345678";

    const auto before = EcpayMetrics::snapshot();
    const auto resp = runCreate(plugin, body);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k200OK);

    const auto json = resp->getJsonObject();
    REQUIRE(json != nullptr);
    CHECK((*json)["action_url"].asString() == ecpay::kTestGatewayUrl);

    const auto &params = (*json)["params"];
    CHECK(params["MerchantID"].asString() == "2000132");
    CHECK(params["TotalAmount"].asString() == "6000");
    CHECK(params["ReturnURL"].asString() ==
          "https://hotel.example.com/pay/ecpay/return");
    CHECK(params["OrderResultURL"].asString() ==
          "https://hotel.example.com/pay/ecpay/result");
    CHECK(params["ClientBackURL"].asString() ==
          "https://hotel.example.com/?bookingId=BK17605123456");
    CHECK(params["TradeDesc"].asString() == "Booking BK17605123456");
    CHECK(params["CustomerPhone"].asString() == "0912345678");

    ecpay::FormParams echoed;
    for (const auto &name : params.getMemberNames())
    {
        echoed[name] = params[name].asString();
    }
    ecpay::CallbackVerifier verifier(testCredentials());
    ecpay::VerifiedPayload verified;
    ecpay::Error error;
    CHECK(verifier.verify(echoed, verified, error));

    const auto after = EcpayMetrics::snapshot();
    CHECK(after["forms_signed"].asUInt64() ==
          before["forms_signed"].asUInt64() + 1);
}

DROGON_TEST(EcpayPlugin_CreatePaymentFormRejectsBadInput)
{
    clearEcpayEnv();
    EcpayPlugin plugin;
    plugin.initAndStart(pluginConfig());

    Json::Value missing;
    missing["amount"] = 6000;
    auto resp = runCreate(plugin, missing);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k400BadRequest);

    Json::Value fractional;
    fractional["trade_no"] = "BK1";
    fractional["amount"] = "60.5";
    resp = runCreate(plugin, fractional);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k400BadRequest);

    const auto before = EcpayMetrics::snapshot();
    Json::Value tooLong;
    tooLong["trade_no"] = "BK1234567890123456789";
    tooLong["amount"] = 6000;
    resp = runCreate(plugin, tooLong);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k400BadRequest);
    CHECK(std::string(resp->body()).find("20 characters") !=
          std::string::npos);
    const auto after = EcpayMetrics::snapshot();
    CHECK(after["form_rejected"].asUInt64() ==
          before["form_rejected"].asUInt64() + 1);
}

DROGON_TEST(EcpayPlugin_NotConfigured)
{
    clearEcpayEnv();
    EcpayPlugin plugin;
    Json::Value config;
    config["ecpay"]["environment"] = "test";
    plugin.initAndStart(config);

    Json::Value body;
    body["trade_no"] = "BK17605123456";
    body["amount"] = 6000;
    auto resp = runCreate(plugin, body);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k503ServiceUnavailable);

    resp = runReturn(plugin, paidNotification("BK17605123456"));
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k503ServiceUnavailable);
    CHECK(std::string(resp->body()).rfind("0|", 0) == 0);
}

DROGON_TEST(EcpayPlugin_ReturnCallbackPaid)
{
    clearEcpayEnv();
    EcpayPlugin plugin;
    plugin.initAndStart(pluginConfig());

    std::vector<ecpay::TradeResult> delivered;
    plugin.setTradeResultHandler(
        [&delivered](const ecpay::TradeResult &result) {
            delivered.push_back(result);
        });

    const auto before = EcpayMetrics::snapshot();
    const auto resp = runReturn(plugin, paidNotification("BK17605123456"));
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k200OK);
    CHECK(std::string(resp->body()) == "1|OK");

    REQUIRE(delivered.size() == 1);
    CHECK(delivered[0].merchantTradeNumber == "BK17605123456");
    CHECK(delivered[0].tradeAmount == 6000);
    CHECK(delivered[0].isPaid());

    const auto after = EcpayMetrics::snapshot();
    CHECK(after["callback_verified"].asUInt64() ==
          before["callback_verified"].asUInt64() + 1);
}

DROGON_TEST(EcpayPlugin_ReturnCallbackRejected)
{
    clearEcpayEnv();
    EcpayPlugin plugin;
    plugin.initAndStart(pluginConfig());

    int delivered = 0;
    plugin.setTradeResultHandler(
        [&delivered](const ecpay::TradeResult &) { ++delivered; });

    const auto before = EcpayMetrics::snapshot();

    auto forged = paidNotification("BK17605123456");
    forged["TradeAmt"] = "1";
    auto resp = runReturn(plugin, forged);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k400BadRequest);
    CHECK(std::string(resp->body()) == "0|CheckMacValue mismatch");

    auto unsignedPayload = paidNotification("BK17605123456");
    unsignedPayload.erase("CheckMacValue");
    resp = runReturn(plugin, unsignedPayload);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k400BadRequest);
    CHECK(std::string(resp->body()) == "0|missing CheckMacValue");

    CHECK(delivered == 0);

    const auto after = EcpayMetrics::snapshot();
    CHECK(after["callback_signature_mismatch"].asUInt64() ==
          before["callback_signature_mismatch"].asUInt64() + 1);
    CHECK(after["callback_missing_signature"].asUInt64() ==
          before["callback_missing_signature"].asUInt64() + 1);
}

DROGON_TEST(EcpayPlugin_UnpaidResultNotDelivered)
{
    clearEcpayEnv();
    EcpayPlugin plugin;
    plugin.initAndStart(pluginConfig());

    int delivered = 0;
    plugin.setTradeResultHandler(
        [&delivered](const ecpay::TradeResult &) { ++delivered; });

    auto failed = paidNotification("BK17605123456");
    failed.erase("CheckMacValue");
    failed["RtnCode"] = "10100058";
    failed["CheckMacValue"] =
        ecpay::computeCheckMacValue(failed, testCredentials());

    const auto resp = runReturn(plugin, failed);
    REQUIRE(resp != nullptr);
    CHECK(std::string(resp->body()) == "1|OK");
    CHECK(delivered == 0);
}

DROGON_TEST(EcpayPlugin_ResultRedirect)
{
    clearEcpayEnv();
    EcpayPlugin plugin;
    plugin.initAndStart(pluginConfig());

    auto resp = runResult(plugin, paidNotification("BK17605123456"));
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k200OK);
    auto json = resp->getJsonObject();
    REQUIRE(json != nullptr);
    CHECK((*json)["status"].asString() == "paid");
    CHECK((*json)["trade_no"].asString() == "BK17605123456");
    CHECK((*json)["amount"].asInt64() == 6000);

    auto forged = paidNotification("BK17605123456");
    forged["RtnCode"] = "1";
    forged["TradeAmt"] = "5999";
    resp = runResult(plugin, forged);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k400BadRequest);
    json = resp->getJsonObject();
    REQUIRE(json != nullptr);
    CHECK((*json)["status"].asString() == "rejected");
    CHECK((*json)["reason"].asString() == "signature_mismatch");
}

DROGON_TEST(EcpayPlugin_BuildWithExplicitCredentials)
{
    clearEcpayEnv();
    EcpayPlugin plugin;
    plugin.initAndStart(pluginConfig());

    auto explicitSet = testCredentials();
    explicitSet.merchantId = "3002607";
    explicitSet.hashKey = "pwFHCqoQZGmho4w6";
    explicitSet.hashIv = "EkRm7iFT261dpevs";

    const auto request = plugin.makeTradeRequest("BK17605123456", 6000);
    ecpay::PaymentForm form;
    ecpay::Error error;
    CHECK(plugin.buildPaymentForm(request, &explicitSet, form, error));
    CHECK(form.params.at("MerchantID") == "3002607");

    ecpay::TradeResult result;
    CHECK(plugin.verifyCallback(form.params, explicitSet, result, error));
    CHECK(result.tradeAmount == 6000);

    // The production gateway stays closed to a test deployment.
    explicitSet.environment = ecpay::Environment::kProduction;
    ecpay::PaymentForm refused;
    ecpay::Error refusedError;
    CHECK(!plugin.buildPaymentForm(request, &explicitSet, refused,
                                   refusedError));
    CHECK(refusedError.kind == ecpay::ErrorKind::kConfiguration);
}

DROGON_TEST(EcpayPlugin_InvalidAmountCountsAsRejectedForm)
{
    clearEcpayEnv();
    EcpayPlugin plugin;
    plugin.initAndStart(pluginConfig());

    const auto before = EcpayMetrics::snapshot();

    Json::Value negative;
    negative["trade_no"] = "BK17605123456";
    negative["amount"] = -100;
    auto resp = runCreate(plugin, negative);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k400BadRequest);

    Json::Value fractional;
    fractional["trade_no"] = "BK17605123456";
    fractional["amount"] = 60.5;
    resp = runCreate(plugin, fractional);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k400BadRequest);

    const auto after = EcpayMetrics::snapshot();
    CHECK(after["form_rejected"].asUInt64() ==
          before["form_rejected"].asUInt64() + 2);
    CHECK(after["forms_signed"].asUInt64() ==
          before["forms_signed"].asUInt64());
}

DROGON_TEST(EcpayPlugin_NonStringCustomerFieldsIgnored)
{
    clearEcpayEnv();
    EcpayPlugin plugin;
    plugin.initAndStart(pluginConfig());

    Json::Value body;
    body["trade_no"] = "BK17605123456";
    body["amount"] = "6000";
    body["customer_name"]["first"] = "Mei";
    body["customer_email"].append("mei@example.com");
    body["customer_phone"] = "0912345678";

    const auto resp = runCreate(plugin, body);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k200OK);

    const auto json = resp->getJsonObject();
    REQUIRE(json != nullptr);
    const auto &params = (*json)["params"];
    CHECK(params["CustomerName"].asString().empty());
    CHECK(params["CustomerEmail"].asString().empty());
    CHECK(params["CustomerPhone"].asString() == "0912345678");
}

DROGON_TEST(EcpayPlugin_SignedCallbackWithoutTradeNumber)
{
    clearEcpayEnv();
    EcpayPlugin plugin;
    plugin.initAndStart(pluginConfig());

    int delivered = 0;
    plugin.setTradeResultHandler(
        [&delivered](const ecpay::TradeResult &) { ++delivered; });

    auto payload = paidNotification("BK17605123456");
    payload.erase("CheckMacValue");
    payload.erase("MerchantTradeNo");
    payload["CheckMacValue"] =
        ecpay::computeCheckMacValue(payload, testCredentials());

    const auto before = EcpayMetrics::snapshot();
    const auto resp = runReturn(plugin, payload);
    REQUIRE(resp != nullptr);
    CHECK(resp->statusCode() == drogon::k400BadRequest);
    CHECK(std::string(resp->body()) == "0|missing MerchantTradeNo");
    CHECK(delivered == 0);

    const auto after = EcpayMetrics::snapshot();
    CHECK(after["callback_parse_error"].asUInt64() ==
          before["callback_parse_error"].asUInt64() + 1);
    CHECK(after["callback_verified"].asUInt64() ==
          before["callback_verified"].asUInt64());
}
