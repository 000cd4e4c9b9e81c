#include "MetricsController.h"
#include "../utils/EcpayMetrics.h"

void MetricsController::metrics(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback)
{
    if (req->method() == Options)
    {
        auto resp = HttpResponse::newHttpResponse();
        callback(resp);
        return;
    }

    auto resp = HttpResponse::newHttpJsonResponse(EcpayMetrics::snapshot());
    callback(resp);
}

void MetricsController::metricsProm(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback)
{
    if (req->method() == Options)
    {
        auto resp = HttpResponse::newHttpResponse();
        callback(resp);
        return;
    }

    auto resp = HttpResponse::newHttpResponse();
    resp->setStatusCode(k200OK);
    resp->setContentTypeCode(CT_TEXT_PLAIN);
    resp->setBody(EcpayMetrics::toPrometheus());
    callback(resp);
}
