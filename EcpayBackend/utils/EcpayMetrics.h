#pragma once

#include <atomic>
#include <cstdint>
#include <json/json.h>
#include <string>
#include "EcpayError.h"

class EcpayMetrics
{
  public:
    static void incFormSigned();
    static void incFormRejected();
    static void incCallbackVerified();
    // Counts the failure under the bucket of its kind.
    static void incCallbackFailure(ecpay::ErrorKind kind);
    static void incAuthMissingKey();
    static void incAuthInvalidKey();
    static void incAuthNotConfigured();

    static Json::Value snapshot();
    static std::string toPrometheus();

  private:
    static std::atomic<uint64_t> formSigned_;
    static std::atomic<uint64_t> formRejected_;
    static std::atomic<uint64_t> callbackVerified_;
    static std::atomic<uint64_t> callbackMissingSignature_;
    static std::atomic<uint64_t> callbackSignatureMismatch_;
    static std::atomic<uint64_t> callbackMerchantMismatch_;
    static std::atomic<uint64_t> callbackParseError_;
    static std::atomic<uint64_t> authMissingKey_;
    static std::atomic<uint64_t> authInvalidKey_;
    static std::atomic<uint64_t> authNotConfigured_;
};
