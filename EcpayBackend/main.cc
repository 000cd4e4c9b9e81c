#include <drogon/drogon.h>
#include "plugins/EcpayPlugin.h"
#include "utils/CorsAdvice.h"

int main()
{
    drogon::app().loadConfigFile("./config.json");
    ecpay::utils::setupCors();

    // Booking status updates belong to the booking service; until it
    // subscribes, paid trades are only logged.
    drogon::app().registerBeginningAdvice([]() {
        auto plugin = drogon::app().getPlugin<EcpayPlugin>();
        if (plugin)
        {
            plugin->setTradeResultHandler(
                [](const ecpay::TradeResult &result) {
                    LOG_INFO << "Trade paid: trade_no="
                             << result.merchantTradeNumber
                             << ", amount=" << result.tradeAmount;
                });
        }
    });

    drogon::app().run();
    return 0;
}
