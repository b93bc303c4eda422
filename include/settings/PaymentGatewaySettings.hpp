#pragma once

#include <cstdlib>
#include <string>

namespace ordercore::settings {

/**
 * @brief Адрес внешнего платёжного шлюза
 *
 * Читает из ENV:
 * - PAYMENT_GATEWAY_HOST (default: "payment-gateway")
 * - PAYMENT_GATEWAY_PORT (default: 8090)
 * - PAYMENT_GATEWAY_CAPTURE_PATH (default: "/api/v1/payments/capture")
 */
class PaymentGatewaySettings {
public:
    PaymentGatewaySettings() {
        if (const char* host = std::getenv("PAYMENT_GATEWAY_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("PAYMENT_GATEWAY_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* path = std::getenv("PAYMENT_GATEWAY_CAPTURE_PATH")) {
            capturePath_ = path;
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getCapturePath() const { return capturePath_; }

private:
    std::string host_ = "payment-gateway";
    int port_ = 8090;
    std::string capturePath_ = "/api/v1/payments/capture";
};

} // namespace ordercore::settings
