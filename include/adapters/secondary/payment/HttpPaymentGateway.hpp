#pragma once

#include "ports/output/IPaymentGateway.hpp"
#include "domain/Errors.hpp"
#include "settings/PaymentGatewaySettings.hpp"
#include "settings/ResilienceSettings.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace ordercore::adapters::secondary {

/**
 * @brief HTTP клиент внешнего платёжного шлюза (Boost.Beast)
 *
 * POST {capturePath} c телом {"order_id": N} и заголовком
 * Idempotency-Key: order-N. Ключ один на заказ, так что повторы и ретраи
 * не списывают деньги дважды, если шлюз поддерживает идемпотентность.
 * Ответ 200: {"approved": bool, "transaction_id": "...", "decline_reason": "..."}.
 *
 * Маппинг ошибок:
 * - дедлайн сокета -> GatewayTimeoutError
 * - ошибки соединения/чтения, 5xx -> GatewayTransientError
 * - 4xx -> GatewayRejectedError
 * - битое тело 200 -> GatewayError
 *
 * Каждый вызов открывает своё соединение и свой io_context, поэтому
 * клиент можно вызывать из нескольких потоков TimeLimiter'а.
 */
class HttpPaymentGateway : public ports::output::IPaymentGateway {
public:
    HttpPaymentGateway(
        std::shared_ptr<settings::PaymentGatewaySettings> settings,
        std::shared_ptr<settings::ResilienceSettings> resilience
    ) : settings_(std::move(settings))
      , timeout_(resilience->getTimeout())
    {
        std::cout << "[HttpPaymentGateway] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << settings_->getCapturePath() << std::endl;
    }

    static std::string idempotencyKey(int64_t orderId) {
        return "order-" + std::to_string(orderId);
    }

    boost::beast::http::request<boost::beast::http::string_body> buildRequest(int64_t orderId) const {
        namespace http = boost::beast::http;

        http::request<http::string_body> req{http::verb::post, settings_->getCapturePath(), 11};
        req.set(http::field::host, settings_->getHost());
        req.set(http::field::content_type, "application/json");
        req.set(http::field::user_agent, "order-core");
        req.set("Idempotency-Key", idempotencyKey(orderId));
        req.body() = nlohmann::json{{"order_id", orderId}}.dump();
        req.prepare_payload();
        return req;
    }

    domain::GatewayResponse capture(int64_t orderId) override {
        namespace beast = boost::beast;
        namespace http = boost::beast::http;
        namespace net = boost::asio;
        using tcp = net::ip::tcp;

        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);

        auto req = buildRequest(orderId);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        beast::error_code failure;

        // Асинхронная цепочка нужна ради expires_after: синхронные операции дедлайн не учитывают
        resolver.async_resolve(settings_->getHost(), std::to_string(settings_->getPort()),
            [&](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) { failure = ec; return; }

                stream.expires_after(timeout_);
                stream.async_connect(results,
                    [&](beast::error_code ec, const tcp::endpoint&) {
                        if (ec) { failure = ec; return; }

                        http::async_write(stream, req,
                            [&](beast::error_code ec, std::size_t) {
                                if (ec) { failure = ec; return; }

                                http::async_read(stream, buffer, res,
                                    [&](beast::error_code ec, std::size_t) {
                                        failure = ec;
                                    });
                            });
                    });
            });

        ioc.run();

        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

        if (failure == beast::error::timeout) {
            std::cerr << "[HttpPaymentGateway] capture(" << orderId << ") timed out" << std::endl;
            throw domain::GatewayTimeoutError("payment gateway timed out after " +
                                              std::to_string(timeout_.count()) + "ms");
        }
        if (failure) {
            std::cerr << "[HttpPaymentGateway] capture(" << orderId << ") I/O error: "
                      << failure.message() << std::endl;
            throw domain::GatewayTransientError("payment gateway I/O error: " + failure.message());
        }

        return parseResponse(orderId, res.result_int(), res.body());
    }

    /**
     * @brief Разбор HTTP-ответа шлюза
     */
    static domain::GatewayResponse parseResponse(int64_t orderId, unsigned status, const std::string& body) {
        if (status >= 400 && status < 500) {
            std::cerr << "[HttpPaymentGateway] capture(" << orderId << ") rejected: " << status << std::endl;
            throw domain::GatewayRejectedError("HTTP " + std::to_string(status) + ": " + body.substr(0, 200));
        }
        if (status != 200) {
            std::cerr << "[HttpPaymentGateway] capture(" << orderId << ") failed: " << status << std::endl;
            throw domain::GatewayTransientError("HTTP " + std::to_string(status));
        }

        try {
            auto json = nlohmann::json::parse(body);

            domain::GatewayResponse response;
            response.approved = json.at("approved").get<bool>();
            if (json.contains("transaction_id") && json["transaction_id"].is_string()) {
                response.transactionId = json["transaction_id"].get<std::string>();
            }
            if (json.contains("decline_reason") && json["decline_reason"].is_string()) {
                response.declineReason = json["decline_reason"].get<std::string>();
            }
            if (response.approved && response.transactionId.empty()) {
                throw domain::GatewayError("approved response without transaction_id");
            }
            return response;

        } catch (const nlohmann::json::exception& e) {
            throw domain::GatewayError(std::string("malformed gateway response: ") + e.what());
        }
    }

private:
    std::shared_ptr<settings::PaymentGatewaySettings> settings_;
    std::chrono::milliseconds timeout_;
};

} // namespace ordercore::adapters::secondary
