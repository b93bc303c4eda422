#pragma once

#include <string>
#include <cstdint>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace ordercore::domain {

/**
 * @brief Денежная сумма с валютой
 *
 * Хранит целую часть и дробную в нано-единицах (10^-9), как Money в protobuf.
 */
class Money {
public:
    static constexpr int32_t NANOS_PER_UNIT = 1000000000;

    int64_t units = 0;
    int32_t nano = 0;
    std::string currency = "USD";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "USD")
        : units(u), nano(n), currency(cur) {}

    static Money zero(const std::string& cur = "USD") {
        return Money(0, 0, cur);
    }

    static Money fromDouble(double value, const std::string& cur = "USD") {
        Money m;
        m.currency = cur;
        m.units = static_cast<int64_t>(value);
        m.nano = static_cast<int32_t>(std::llround((value - static_cast<double>(m.units)) * 1e9));
        m.normalize();
        return m;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    bool isZero() const { return units == 0 && nano == 0; }
    bool isNegative() const { return units < 0 || (units == 0 && nano < 0); }

    /**
     * @brief Строка с двумя знаками после запятой ("12.50")
     */
    std::string toString() const {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << toDouble();
        return ss.str();
    }

    Money operator+(const Money& other) const {
        Money result(units + other.units, nano + other.nano, currency);
        result.normalize();
        return result;
    }

    Money operator-(const Money& other) const {
        Money result(units - other.units, nano - other.nano, currency);
        result.normalize();
        return result;
    }

    bool operator<(const Money& other) const {
        return units < other.units || (units == other.units && nano < other.nano);
    }

    bool operator>(const Money& other) const { return other < *this; }
    bool operator>=(const Money& other) const { return !(*this < other); }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const { return !(*this == other); }

private:
    void normalize() {
        if (nano >= NANOS_PER_UNIT) {
            units += nano / NANOS_PER_UNIT;
            nano %= NANOS_PER_UNIT;
        } else if (nano <= -NANOS_PER_UNIT) {
            units -= (-nano) / NANOS_PER_UNIT;
            nano = -((-nano) % NANOS_PER_UNIT);
        }
        // Знаки units и nano должны совпадать
        if (units > 0 && nano < 0) {
            units--;
            nano += NANOS_PER_UNIT;
        } else if (units < 0 && nano > 0) {
            units++;
            nano -= NANOS_PER_UNIT;
        }
    }
};

} // namespace ordercore::domain
