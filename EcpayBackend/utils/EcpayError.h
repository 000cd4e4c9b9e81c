#pragma once

#include <string>

namespace ecpay
{
enum class ErrorKind
{
    kNone,
    kConfiguration,
    kValidation,
    kMissingSignature,
    kSignatureMismatch,
    kMerchantMismatch,
    kParse
};

inline const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::kNone:
            return "none";
        case ErrorKind::kConfiguration:
            return "configuration";
        case ErrorKind::kValidation:
            return "validation";
        case ErrorKind::kMissingSignature:
            return "missing_signature";
        case ErrorKind::kSignatureMismatch:
            return "signature_mismatch";
        case ErrorKind::kMerchantMismatch:
            return "merchant_mismatch";
        case ErrorKind::kParse:
            return "parse";
    }
    return "unknown";
}

// Out-parameter filled by every failing operation of the module.
struct Error
{
    ErrorKind kind{ErrorKind::kNone};
    std::string message;

    void set(ErrorKind errorKind, const std::string &errorMessage)
    {
        kind = errorKind;
        message = errorMessage;
    }

    bool isVerificationFailure() const
    {
        return kind == ErrorKind::kMissingSignature ||
               kind == ErrorKind::kSignatureMismatch ||
               kind == ErrorKind::kMerchantMismatch;
    }
};
}  // namespace ecpay
