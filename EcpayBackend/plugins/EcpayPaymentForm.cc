#include "EcpayPaymentForm.h"
#include "CheckMacValue.h"
#include "EcpayCredentials.h"
#include "../utils/EcpayUtils.h"

namespace
{
bool isAlphanumeric(const std::string &value)
{
    for (char ch : value)
    {
        const auto c = static_cast<unsigned char>(ch);
        if (!((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
              (c >= '0' && c <= '9')))
        {
            return false;
        }
    }
    return true;
}
}  // namespace

namespace ecpay
{
bool PaymentFormBuilder::validate(const TradeRequest &request, Error &error)
{
    if (request.tradeNumber.empty())
    {
        error.set(ErrorKind::kValidation, "missing trade number");
        return false;
    }
    if (request.tradeNumber.size() > kMaxTradeNumberLength)
    {
        error.set(ErrorKind::kValidation,
                  "trade number exceeds 20 characters: " +
                      request.tradeNumber);
        return false;
    }
    if (!isAlphanumeric(request.tradeNumber))
    {
        error.set(ErrorKind::kValidation,
                  "trade number must be alphanumeric: " +
                      request.tradeNumber);
        return false;
    }
    if (!utils::isTradeDateFormat(request.tradeTimestamp))
    {
        error.set(ErrorKind::kValidation,
                  "trade date must be yyyy/MM/dd HH:mm:ss");
        return false;
    }
    if (request.amount < 0)
    {
        error.set(ErrorKind::kValidation, "amount must not be negative");
        return false;
    }
    if (request.description.empty() ||
        request.description.size() > kMaxTradeDescLength)
    {
        error.set(ErrorKind::kValidation,
                  "trade description must be 1-200 bytes");
        return false;
    }
    if (request.itemName.empty() ||
        request.itemName.size() > kMaxItemNameLength)
    {
        error.set(ErrorKind::kValidation, "item name must be 1-400 bytes");
        return false;
    }
    if (!utils::isAbsoluteHttpUrl(request.returnUrl))
    {
        error.set(ErrorKind::kValidation, "invalid ReturnURL");
        return false;
    }
    if (!utils::isAbsoluteHttpUrl(request.resultUrl))
    {
        error.set(ErrorKind::kValidation, "invalid OrderResultURL");
        return false;
    }
    if (!utils::isAbsoluteHttpUrl(request.clientBackUrl))
    {
        error.set(ErrorKind::kValidation, "invalid ClientBackURL");
        return false;
    }
    return true;
}

bool PaymentFormBuilder::build(const TradeRequest &request,
                               const CredentialSet &credentials,
                               PaymentForm &form,
                               Error &error)
{
    if (!missingCredentialFields(credentials).empty())
    {
        error.set(ErrorKind::kConfiguration, "incomplete ecpay credentials");
        return false;
    }
    if (!validate(request, error))
    {
        return false;
    }

    FormParams params;
    params[kMerchantIdField] = credentials.merchantId;
    params["MerchantTradeNo"] = request.tradeNumber;
    params["MerchantTradeDate"] = request.tradeTimestamp;
    params["PaymentType"] = "aio";
    params["TotalAmount"] = std::to_string(request.amount);
    params["TradeDesc"] = request.description;
    params["ItemName"] = request.itemName;
    params["ReturnURL"] = request.returnUrl;
    params["OrderResultURL"] = request.resultUrl;
    params["ChoosePayment"] = "Credit";
    params["EncryptType"] = "1";
    params["ClientBackURL"] = request.clientBackUrl;
    params["CustomerName"] = request.customerName;
    params["CustomerEmail"] = request.customerEmail;
    params["CustomerPhone"] = request.customerPhone;

    params[kCheckMacValueField] = computeCheckMacValue(params, credentials);

    form.actionUrl = gatewayUrlFor(credentials.environment);
    form.params = std::move(params);
    return true;
}
}  // namespace ecpay
