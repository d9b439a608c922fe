#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <ostream>
#include <string>

namespace ledger::domain {

/**
 * @brief Режим округления при квантовании
 */
enum class RoundingMode {
    DOWN,       ///< к нулю (усечение)
    HALF_EVEN,  ///< банковское округление
    HALF_UP     ///< половина от нуля
};

/**
 * @brief Точная десятичная сумма
 *
 * Хранит значение как целое число единиц с масштабом 10^-8
 * (максимальная точность актива). Произвольная разрядность через
 * boost::multiprecision::cpp_int, никакой плавающей точки.
 *
 * Текстовое представление - единственный формат хранения и обмена.
 */
class Amount {
public:
    using Units = boost::multiprecision::cpp_int;

    static constexpr int kScale = 8;
    static constexpr int kMaxDecimals = kScale;

    Amount() = default;

    static Amount fromUnits(Units scaled);
    static Amount whole(int64_t value);

    /**
     * @brief Разобрать "[-+]123.45678"
     * @throws std::invalid_argument при неверном формате или более 8 знаков
     */
    static Amount parse(const std::string& text);

    /// Минимальная запись: "10.5", "-3", "0"
    std::string toString() const;

    /// Фиксированное число знаков (с округлением HALF_EVEN, если нужно)
    std::string toString(int decimals) const;

    Amount quantize(int decimals, RoundingMode mode = RoundingMode::HALF_EVEN) const;
    bool isQuantized(int decimals) const;

    /// this * factor, результат округляется до decimals знаков
    Amount multiply(const Amount& factor, int decimals, RoundingMode mode) const;

    /// this / divisor, результат округляется до decimals знаков
    /// @throws std::domain_error при делении на ноль
    Amount divide(const Amount& divisor, int decimals, RoundingMode mode) const;

    bool isZero() const { return units_.is_zero(); }
    bool isNegative() const { return units_.sign() < 0; }
    bool isPositive() const { return units_.sign() > 0; }
    Amount abs() const { return isNegative() ? -*this : *this; }

    const Units& units() const { return units_; }

    Amount operator-() const { return fromUnits(-units_); }
    Amount operator+(const Amount& other) const { return fromUnits(units_ + other.units_); }
    Amount operator-(const Amount& other) const { return fromUnits(units_ - other.units_); }
    Amount& operator+=(const Amount& other) { units_ += other.units_; return *this; }
    Amount& operator-=(const Amount& other) { units_ -= other.units_; return *this; }

    bool operator==(const Amount& other) const { return units_ == other.units_; }
    bool operator!=(const Amount& other) const { return units_ != other.units_; }
    bool operator<(const Amount& other) const { return units_ < other.units_; }
    bool operator<=(const Amount& other) const { return units_ <= other.units_; }
    bool operator>(const Amount& other) const { return units_ > other.units_; }
    bool operator>=(const Amount& other) const { return units_ >= other.units_; }

private:
    Units units_ = 0;
};

inline std::ostream& operator<<(std::ostream& os, const Amount& amount) {
    return os << amount.toString();
}

} // namespace ledger::domain
