#pragma once

#include <string>
#include "EcpayTypes.h"

namespace ecpay
{
/**
 * Builds the CheckMacValue digest input:
 *
 *   HashKey=<key>&k1=v1&...&kn=vn&HashIV=<iv>
 *
 * with CheckMacValue itself left out, empty values kept and keys in
 * byte-wise order. The whole string is then URL-component encoded, lower
 * cased and passed through the gateway's substitution table.
 */
class ParameterCanonicalizer
{
  public:
    static std::string canonicalize(const FormParams &params,
                                    const std::string &hashKey,
                                    const std::string &hashIv);

    // Encode, lower-case and substitute. Exposed for the golden tests.
    static std::string applyGatewayEncoding(const std::string &raw);
};

class ChecksumEngine
{
  public:
    // Upper-case hex SHA-256 of the canonical string.
    static std::string sign(const std::string &canonical);

    // Case-sensitive; does not stop at the first differing byte.
    static bool verify(const std::string &received,
                       const std::string &canonical);
};

std::string computeCheckMacValue(const FormParams &params,
                                 const CredentialSet &credentials);
}  // namespace ecpay
