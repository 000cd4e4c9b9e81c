#pragma once
#include <cstdint>
#include <json/json.h>
#include <map>
#include <string>
#include <trantor/utils/Date.h>

namespace ecpay::utils
{
bool getRequiredString(const Json::Value &json,
                       const char *key,
                       std::string &value);

bool getRequiredField(const std::map<std::string, std::string> &fields,
                      const char *key,
                      std::string &value);

bool parseWholeAmount(const std::string &amount, int64_t &value);

// Percent-encodes every byte except A-Z a-z 0-9 and - _ . ! ~ * ' ( ),
// with upper-case hex digits.
std::string urlEncodeComponent(const std::string &src);

bool isAbsoluteHttpUrl(const std::string &url);

bool isTradeDateFormat(const std::string &value);

std::string formatTradeDate(const trantor::Date &date);

std::string maskMerchantId(const std::string &merchantId);
}
