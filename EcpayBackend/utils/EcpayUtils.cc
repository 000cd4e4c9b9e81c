#include "EcpayUtils.h"
#include <cctype>

namespace ecpay::utils
{
bool getRequiredString(const Json::Value &json,
                       const char *key,
                       std::string &value)
{
    if (!json.isObject() || !json.isMember(key))
    {
        return false;
    }
    if (json[key].isString() || json[key].isNumeric())
    {
        value = json[key].asString();
        return !value.empty();
    }
    return false;
}

bool getRequiredField(const std::map<std::string, std::string> &fields,
                      const char *key,
                      std::string &value)
{
    const auto it = fields.find(key);
    if (it == fields.end() || it->second.empty())
    {
        return false;
    }
    value = it->second;
    return true;
}

bool parseWholeAmount(const std::string &amount, int64_t &value)
{
    if (amount.empty() || amount.size() > 18)
    {
        return false;
    }
    for (char c : amount)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
        {
            return false;
        }
    }

    int64_t result = 0;
    for (char c : amount)
    {
        result = result * 10 + (c - '0');
    }
    value = result;
    return true;
}

std::string urlEncodeComponent(const std::string &src)
{
    static const char kHex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(src.size() * 3);
    for (char ch : src)
    {
        const auto c = static_cast<unsigned char>(ch);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
            c == '!' || c == '~' || c == '*' || c == '\'' || c == '(' ||
            c == ')')
        {
            result.push_back(static_cast<char>(c));
            continue;
        }
        result.push_back('%');
        result.push_back(kHex[c >> 4]);
        result.push_back(kHex[c & 0x0F]);
    }
    return result;
}

bool isAbsoluteHttpUrl(const std::string &url)
{
    std::string rest;
    if (url.rfind("https://", 0) == 0)
    {
        rest = url.substr(8);
    }
    else if (url.rfind("http://", 0) == 0)
    {
        rest = url.substr(7);
    }
    else
    {
        return false;
    }

    const auto hostEnd = rest.find_first_of("/?#");
    const auto host = rest.substr(0, hostEnd);
    if (host.empty())
    {
        return false;
    }
    for (char c : url)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7F)
        {
            return false;
        }
    }
    return true;
}

bool isTradeDateFormat(const std::string &value)
{
    // yyyy/MM/dd HH:mm:ss
    static const char kPattern[] = "0000/00/00 00:00:00";
    if (value.size() != sizeof(kPattern) - 1)
    {
        return false;
    }
    for (size_t i = 0; i < value.size(); ++i)
    {
        if (kPattern[i] == '0')
        {
            if (!std::isdigit(static_cast<unsigned char>(value[i])))
            {
                return false;
            }
        }
        else if (value[i] != kPattern[i])
        {
            return false;
        }
    }

    const int month = std::stoi(value.substr(5, 2));
    const int day = std::stoi(value.substr(8, 2));
    const int hour = std::stoi(value.substr(11, 2));
    const int minute = std::stoi(value.substr(14, 2));
    const int second = std::stoi(value.substr(17, 2));
    return month >= 1 && month <= 12 && day >= 1 && day <= 31 &&
           hour <= 23 && minute <= 59 && second <= 59;
}

std::string formatTradeDate(const trantor::Date &date)
{
    return date.toCustomedFormattedStringLocal("%Y/%m/%d %H:%M:%S");
}

std::string maskMerchantId(const std::string &merchantId)
{
    if (merchantId.empty())
    {
        return "(unset)";
    }
    return merchantId.substr(0, 4) + "****";
}
}  // namespace ecpay::utils
