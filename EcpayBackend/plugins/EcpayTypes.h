#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace ecpay
{
// Wire-level form fields, ordered by byte-wise key comparison.
using FormParams = std::map<std::string, std::string>;

constexpr const char *kCheckMacValueField = "CheckMacValue";
constexpr const char *kMerchantIdField = "MerchantID";
constexpr size_t kMaxTradeNumberLength = 20;

enum class Environment
{
    kTest,
    kProduction
};

struct CredentialSet
{
    std::string merchantId;
    std::string hashKey;
    std::string hashIv;
    std::string gatewayUrl;
    Environment environment{Environment::kTest};
};

struct TradeRequest
{
    std::string tradeNumber;
    std::string tradeTimestamp;
    int64_t amount{0};
    std::string description;
    std::string itemName;
    std::string returnUrl;
    std::string resultUrl;
    std::string clientBackUrl;
    std::string customerName;
    std::string customerEmail;
    std::string customerPhone;
};

struct PaymentForm
{
    std::string actionUrl;
    FormParams params;
};

struct TradeResult
{
    std::string merchantTradeNumber;
    std::string gatewayTradeNumber;
    std::string returnCode;
    std::string returnMessage;
    int64_t tradeAmount{0};
    std::string paymentDate;
    std::string paymentType;
    int64_t paymentTypeChargeFee{0};
    std::string tradeDate;
    bool simulatePaid{false};

    bool isPaid() const { return returnCode == "1"; }
};
}  // namespace ecpay
