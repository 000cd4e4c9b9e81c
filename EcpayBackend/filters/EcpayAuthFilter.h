#pragma once

#include <drogon/HttpFilter.h>

// Guards checkout form creation with the API keys listed under
// custom_config.ecpay.api_keys, ECPAY_API_KEY or ECPAY_API_KEYS.
class EcpayAuthFilter : public drogon::HttpFilter<EcpayAuthFilter>
{
  public:
    void doFilter(const drogon::HttpRequestPtr &req,
                  drogon::FilterCallback &&fcb,
                  drogon::FilterChainCallback &&fccb) override;
};
