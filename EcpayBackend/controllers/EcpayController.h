#pragma once

#include <drogon/HttpController.h>
#include "../plugins/EcpayPlugin.h"

using namespace drogon;

class EcpayController : public drogon::HttpController<EcpayController>
{
  public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(EcpayController::createPaymentForm,
                  "/pay/ecpay/create",
                  Post,
                  Options,
                  "EcpayAuthFilter");
    ADD_METHOD_TO(EcpayController::returnCallback, "/pay/ecpay/return", Post);
    ADD_METHOD_TO(EcpayController::resultRedirect,
                  "/pay/ecpay/result",
                  Get,
                  Post);
    METHOD_LIST_END

    void createPaymentForm(
        const HttpRequestPtr &req,
        std::function<void(const HttpResponsePtr &)> &&callback);

    void returnCallback(const HttpRequestPtr &req,
                        std::function<void(const HttpResponsePtr &)> &&callback);

    void resultRedirect(const HttpRequestPtr &req,
                        std::function<void(const HttpResponsePtr &)> &&callback);
};
