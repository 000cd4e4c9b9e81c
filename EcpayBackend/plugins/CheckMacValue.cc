#include "CheckMacValue.h"
#include "../utils/EcpayUtils.h"
#include <drogon/utils/Utilities.h>
#include <algorithm>
#include <cctype>
#include <openssl/crypto.h>

namespace
{
struct Substitution
{
    const char *encoded;
    const char *literal;
};

// The gateway's URL encoder leaves these unescaped, so the lower-cased
// generic encoding is rewritten to match it.
constexpr Substitution kGatewaySubstitutions[] = {{"%20", "+"},
                                                  {"%2d", "-"},
                                                  {"%5f", "_"},
                                                  {"%2e", "."},
                                                  {"%21", "!"},
                                                  {"%2a", "*"},
                                                  {"%28", "("},
                                                  {"%29", ")"}};

void replaceAll(std::string &text,
                const std::string &from,
                const std::string &to)
{
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos)
    {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}
}  // namespace

namespace ecpay
{
std::string ParameterCanonicalizer::canonicalize(const FormParams &params,
                                                 const std::string &hashKey,
                                                 const std::string &hashIv)
{
    std::string raw = "HashKey=" + hashKey;
    for (const auto &item : params)
    {
        if (item.first == kCheckMacValueField)
        {
            continue;
        }
        raw += "&" + item.first + "=" + item.second;
    }
    raw += "&HashIV=" + hashIv;
    return applyGatewayEncoding(raw);
}

std::string ParameterCanonicalizer::applyGatewayEncoding(
    const std::string &raw)
{
    std::string encoded = utils::urlEncodeComponent(raw);
    std::transform(encoded.begin(),
                   encoded.end(),
                   encoded.begin(),
                   [](unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    for (const auto &sub : kGatewaySubstitutions)
    {
        replaceAll(encoded, sub.encoded, sub.literal);
    }
    return encoded;
}

std::string ChecksumEngine::sign(const std::string &canonical)
{
    return drogon::utils::getSha256(canonical);
}

bool ChecksumEngine::verify(const std::string &received,
                            const std::string &canonical)
{
    const std::string expected = sign(canonical);
    if (received.size() != expected.size())
    {
        return false;
    }
    return CRYPTO_memcmp(received.data(), expected.data(), expected.size()) ==
           0;
}

std::string computeCheckMacValue(const FormParams &params,
                                 const CredentialSet &credentials)
{
    return ChecksumEngine::sign(ParameterCanonicalizer::canonicalize(
        params, credentials.hashKey, credentials.hashIv));
}
}  // namespace ecpay
