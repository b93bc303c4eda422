#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

namespace ordercore::utils {

/**
 * @brief Бизнес-номер заказа: ORD-<8 цифр времени>-<6 цифр случайных>
 *
 * Например ORD-71234567-004211. Уникальность окончательно гарантирует
 * unique-индекс в Order Store.
 */
class OrderNumberGenerator {
public:
    static std::string generate() {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<int> dist(0, 999999);

        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        char buf[32];
        std::snprintf(buf, sizeof(buf), "ORD-%08lld-%06d",
                      static_cast<long long>(millis % 100000000LL), dist(gen));
        return buf;
    }
};

} // namespace ordercore::utils
