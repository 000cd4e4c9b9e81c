#include "EcpayCallback.h"
#include "CheckMacValue.h"
#include "../utils/EcpayUtils.h"

using ecpay::utils::getRequiredField;
using ecpay::utils::parseWholeAmount;

namespace
{
std::string optionalField(const ecpay::FormParams &fields, const char *key)
{
    const auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
}
}  // namespace

namespace ecpay
{
CallbackVerifier::CallbackVerifier(const CredentialSet &credentials)
    : credentials_(credentials)
{
}

bool CallbackVerifier::verify(const FormParams &payload,
                              VerifiedPayload &verified,
                              Error &error) const
{
    std::string received;
    if (!getRequiredField(payload, kCheckMacValueField, received))
    {
        error.set(ErrorKind::kMissingSignature, "missing CheckMacValue");
        return false;
    }

    const auto merchant = payload.find(kMerchantIdField);
    if (merchant != payload.end() &&
        merchant->second != credentials_.merchantId)
    {
        error.set(ErrorKind::kMerchantMismatch,
                  "callback for another merchant");
        return false;
    }

    FormParams fields = payload;
    fields.erase(kCheckMacValueField);

    const auto canonical = ParameterCanonicalizer::canonicalize(
        fields, credentials_.hashKey, credentials_.hashIv);
    if (!ChecksumEngine::verify(received, canonical))
    {
        error.set(ErrorKind::kSignatureMismatch, "CheckMacValue mismatch");
        return false;
    }

    verified.fields_ = std::move(fields);
    return true;
}

bool ResultParser::parse(const VerifiedPayload &payload,
                         TradeResult &result,
                         Error &error)
{
    const auto &fields = payload.fields();

    TradeResult parsed;
    if (!getRequiredField(fields, "MerchantTradeNo",
                          parsed.merchantTradeNumber))
    {
        error.set(ErrorKind::kParse, "missing MerchantTradeNo");
        return false;
    }

    // Result notifications carry TradeAmt; a signed checkout form echoed
    // back only has TotalAmount.
    std::string tradeAmount;
    if (!getRequiredField(fields, "TradeAmt", tradeAmount) &&
        !getRequiredField(fields, "TotalAmount", tradeAmount))
    {
        error.set(ErrorKind::kParse, "missing TradeAmt");
        return false;
    }
    if (!parseWholeAmount(tradeAmount, parsed.tradeAmount))
    {
        error.set(ErrorKind::kParse, "invalid TradeAmt: " + tradeAmount);
        return false;
    }

    // Without RtnCode the result never reports isPaid().
    parsed.gatewayTradeNumber = optionalField(fields, "TradeNo");
    parsed.returnCode = optionalField(fields, "RtnCode");
    parsed.returnMessage = optionalField(fields, "RtnMsg");
    parsed.paymentDate = optionalField(fields, "PaymentDate");
    parsed.paymentType = optionalField(fields, "PaymentType");
    parsed.tradeDate = optionalField(fields, "TradeDate");

    const auto chargeFee = optionalField(fields, "PaymentTypeChargeFee");
    if (!chargeFee.empty() &&
        !parseWholeAmount(chargeFee, parsed.paymentTypeChargeFee))
    {
        error.set(ErrorKind::kParse,
                  "invalid PaymentTypeChargeFee: " + chargeFee);
        return false;
    }

    const auto simulatePaid = optionalField(fields, "SimulatePaid");
    if (simulatePaid == "1")
    {
        parsed.simulatePaid = true;
    }
    else if (!simulatePaid.empty() && simulatePaid != "0")
    {
        error.set(ErrorKind::kParse, "invalid SimulatePaid: " + simulatePaid);
        return false;
    }

    result = std::move(parsed);
    return true;
}
}  // namespace ecpay
