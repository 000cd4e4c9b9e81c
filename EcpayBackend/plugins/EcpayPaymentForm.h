#pragma once

#include "EcpayTypes.h"
#include "../utils/EcpayError.h"

namespace ecpay
{
constexpr size_t kMaxTradeDescLength = 200;
constexpr size_t kMaxItemNameLength = 400;

class PaymentFormBuilder
{
  public:
    /**
     * Fills @p form with the signed AIO checkout fields and the gateway
     * endpoint of @p credentials.environment. On failure nothing is written
     * to @p form and @p error carries a validation or configuration kind.
     */
    static bool build(const TradeRequest &request,
                      const CredentialSet &credentials,
                      PaymentForm &form,
                      Error &error);

    static bool validate(const TradeRequest &request, Error &error);
};
}  // namespace ecpay
