#pragma once

#include <string>
#include "EcpayTypes.h"
#include "../utils/EcpayError.h"

namespace ecpay
{
/**
 * Callback fields whose CheckMacValue has been checked. Only
 * CallbackVerifier fills one; a default-constructed payload is empty.
 */
class VerifiedPayload
{
  public:
    VerifiedPayload() = default;

    const FormParams &fields() const { return fields_; }
    bool empty() const { return fields_.empty(); }

  private:
    friend class CallbackVerifier;
    FormParams fields_;
};

class CallbackVerifier
{
  public:
    // Bound to the credential set that issued the original request.
    explicit CallbackVerifier(const CredentialSet &credentials);

    /**
     * Checks the CheckMacValue of an inbound gateway payload.
     *
     * Fails with kMissingSignature when CheckMacValue is absent or empty,
     * kMerchantMismatch when the payload names another MerchantID, and
     * kSignatureMismatch when the recomputed value differs. Has no side
     * effects.
     */
    bool verify(const FormParams &payload,
                VerifiedPayload &verified,
                Error &error) const;

    const CredentialSet &credentials() const { return credentials_; }

  private:
    CredentialSet credentials_;
};

class ResultParser
{
  public:
    static bool parse(const VerifiedPayload &payload,
                      TradeResult &result,
                      Error &error);
};
}  // namespace ecpay
