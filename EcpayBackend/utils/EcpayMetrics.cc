#include "EcpayMetrics.h"

std::atomic<uint64_t> EcpayMetrics::formSigned_{0};
std::atomic<uint64_t> EcpayMetrics::formRejected_{0};
std::atomic<uint64_t> EcpayMetrics::callbackVerified_{0};
std::atomic<uint64_t> EcpayMetrics::callbackMissingSignature_{0};
std::atomic<uint64_t> EcpayMetrics::callbackSignatureMismatch_{0};
std::atomic<uint64_t> EcpayMetrics::callbackMerchantMismatch_{0};
std::atomic<uint64_t> EcpayMetrics::callbackParseError_{0};
std::atomic<uint64_t> EcpayMetrics::authMissingKey_{0};
std::atomic<uint64_t> EcpayMetrics::authInvalidKey_{0};
std::atomic<uint64_t> EcpayMetrics::authNotConfigured_{0};

namespace
{
struct Counter
{
    const char *key;
    const char *help;
};

constexpr Counter kCounters[] = {
    {"forms_signed", "Signed checkout forms"},
    {"form_rejected", "Checkout requests rejected before signing"},
    {"callback_verified", "Callbacks with a valid CheckMacValue"},
    {"callback_missing_signature", "Callbacks without CheckMacValue"},
    {"callback_signature_mismatch", "Callbacks failing CheckMacValue"},
    {"callback_merchant_mismatch", "Callbacks naming another merchant"},
    {"callback_parse_error", "Verified callbacks with unusable fields"},
    {"auth_missing_key", "Missing API key count"},
    {"auth_invalid_key", "Invalid API key count"},
    {"auth_not_configured", "API key not configured count"}};
}  // namespace

void EcpayMetrics::incFormSigned()
{
    ++formSigned_;
}

void EcpayMetrics::incFormRejected()
{
    ++formRejected_;
}

void EcpayMetrics::incCallbackVerified()
{
    ++callbackVerified_;
}

void EcpayMetrics::incCallbackFailure(ecpay::ErrorKind kind)
{
    switch (kind)
    {
        case ecpay::ErrorKind::kMissingSignature:
            ++callbackMissingSignature_;
            break;
        case ecpay::ErrorKind::kSignatureMismatch:
            ++callbackSignatureMismatch_;
            break;
        case ecpay::ErrorKind::kMerchantMismatch:
            ++callbackMerchantMismatch_;
            break;
        case ecpay::ErrorKind::kParse:
            ++callbackParseError_;
            break;
        default:
            break;
    }
}

void EcpayMetrics::incAuthMissingKey()
{
    ++authMissingKey_;
}

void EcpayMetrics::incAuthInvalidKey()
{
    ++authInvalidKey_;
}

void EcpayMetrics::incAuthNotConfigured()
{
    ++authNotConfigured_;
}

Json::Value EcpayMetrics::snapshot()
{
    Json::Value root;
    root["forms_signed"] = static_cast<Json::UInt64>(formSigned_.load());
    root["form_rejected"] = static_cast<Json::UInt64>(formRejected_.load());
    root["callback_verified"] =
        static_cast<Json::UInt64>(callbackVerified_.load());
    root["callback_missing_signature"] =
        static_cast<Json::UInt64>(callbackMissingSignature_.load());
    root["callback_signature_mismatch"] =
        static_cast<Json::UInt64>(callbackSignatureMismatch_.load());
    root["callback_merchant_mismatch"] =
        static_cast<Json::UInt64>(callbackMerchantMismatch_.load());
    root["callback_parse_error"] =
        static_cast<Json::UInt64>(callbackParseError_.load());
    root["auth_missing_key"] =
        static_cast<Json::UInt64>(authMissingKey_.load());
    root["auth_invalid_key"] =
        static_cast<Json::UInt64>(authInvalidKey_.load());
    root["auth_not_configured"] =
        static_cast<Json::UInt64>(authNotConfigured_.load());
    return root;
}

std::string EcpayMetrics::toPrometheus()
{
    const auto values = snapshot();

    std::string body;
    for (const auto &counter : kCounters)
    {
        const std::string name = std::string("ecpay_") + counter.key + "_total";
        body += "# HELP " + name + " " + counter.help + "\n";
        body += "# TYPE " + name + " counter\n";
        body += name + " " +
                std::to_string(values[counter.key].asUInt64()) + "\n";
    }
    return body;
}
