#include "EcpayController.h"

void EcpayController::createPaymentForm(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback)
{
    if (req->method() == Options)
    {
        auto resp = HttpResponse::newHttpResponse();
        callback(resp);
        return;
    }

    auto plugin = drogon::app().getPlugin<EcpayPlugin>();
    plugin->createPaymentForm(req, std::move(callback));
}

void EcpayController::returnCallback(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback)
{
    auto plugin = drogon::app().getPlugin<EcpayPlugin>();
    plugin->handleReturnCallback(req, std::move(callback));
}

void EcpayController::resultRedirect(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback)
{
    auto plugin = drogon::app().getPlugin<EcpayPlugin>();
    plugin->handleResultRedirect(req, std::move(callback));
}
