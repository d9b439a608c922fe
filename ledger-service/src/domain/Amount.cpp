#include "domain/Amount.hpp"

#include <stdexcept>

namespace ledger::domain {

namespace {

Amount::Units pow10(int exponent) {
    Amount::Units result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

void checkDecimals(int decimals) {
    if (decimals < 0 || decimals > Amount::kMaxDecimals) {
        throw std::invalid_argument("decimals must be in [0, 8], got " + std::to_string(decimals));
    }
}

// num / den с округлением; cpp_int делит с усечением к нулю
Amount::Units roundedDivide(const Amount::Units& num, const Amount::Units& den, RoundingMode mode) {
    Amount::Units q = num / den;
    Amount::Units r = num % den;
    if (r.is_zero() || mode == RoundingMode::DOWN) {
        return q;
    }

    Amount::Units twiceRemainder = boost::multiprecision::abs(r) * 2;
    Amount::Units absDen = boost::multiprecision::abs(den);
    int direction = ((num.sign() < 0) != (den.sign() < 0)) ? -1 : 1;

    bool awayFromZero = false;
    if (mode == RoundingMode::HALF_UP) {
        awayFromZero = twiceRemainder >= absDen;
    } else {
        awayFromZero = twiceRemainder > absDen ||
                       (twiceRemainder == absDen && (q % 2) != 0);
    }
    return awayFromZero ? q + direction : q;
}

} // namespace

Amount Amount::fromUnits(Units scaled) {
    Amount a;
    a.units_ = std::move(scaled);
    return a;
}

Amount Amount::whole(int64_t value) {
    return fromUnits(Units(value) * pow10(kScale));
}

Amount Amount::parse(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    size_t end = text.find_last_not_of(" \t");
    if (begin == std::string::npos) {
        throw std::invalid_argument("empty amount");
    }
    std::string s = text.substr(begin, end - begin + 1);

    bool negative = false;
    size_t pos = 0;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        pos = 1;
    }

    Units intPart = 0;
    Units fracPart = 0;
    int intDigits = 0;
    int fracDigits = 0;
    bool seenDot = false;

    for (; pos < s.size(); ++pos) {
        char c = s[pos];
        if (c == '.') {
            if (seenDot) {
                throw std::invalid_argument("invalid amount: " + text);
            }
            seenDot = true;
        } else if (c >= '0' && c <= '9') {
            if (seenDot) {
                if (++fracDigits > kScale) {
                    throw std::invalid_argument("more than 8 decimal places: " + text);
                }
                fracPart = fracPart * 10 + (c - '0');
            } else {
                ++intDigits;
                intPart = intPart * 10 + (c - '0');
            }
        } else {
            throw std::invalid_argument("invalid amount: " + text);
        }
    }

    if (intDigits == 0 && fracDigits == 0) {
        throw std::invalid_argument("invalid amount: " + text);
    }

    Units scaled = intPart * pow10(kScale) + fracPart * pow10(kScale - fracDigits);
    return fromUnits(negative ? -scaled : scaled);
}

std::string Amount::toString() const {
    Units absUnits = boost::multiprecision::abs(units_);
    Units scale = pow10(kScale);
    std::string intStr = Units(absUnits / scale).str();
    std::string fracStr = Units(absUnits % scale).str();
    fracStr.insert(0, kScale - fracStr.size(), '0');

    size_t last = fracStr.find_last_not_of('0');
    std::string result = isNegative() ? "-" : "";
    result += intStr;
    if (last != std::string::npos) {
        result += "." + fracStr.substr(0, last + 1);
    }
    return result;
}

std::string Amount::toString(int decimals) const {
    Amount q = quantize(decimals);
    Units absUnits = boost::multiprecision::abs(q.units_);
    Units scale = pow10(kScale);
    std::string intStr = Units(absUnits / scale).str();
    std::string fracStr = Units(absUnits % scale).str();
    fracStr.insert(0, kScale - fracStr.size(), '0');

    std::string result = q.isNegative() ? "-" : "";
    result += intStr;
    if (decimals > 0) {
        result += "." + fracStr.substr(0, decimals);
    }
    return result;
}

Amount Amount::quantize(int decimals, RoundingMode mode) const {
    checkDecimals(decimals);
    Units step = pow10(kScale - decimals);
    return fromUnits(roundedDivide(units_, step, mode) * step);
}

bool Amount::isQuantized(int decimals) const {
    checkDecimals(decimals);
    return (units_ % pow10(kScale - decimals)).is_zero();
}

Amount Amount::multiply(const Amount& factor, int decimals, RoundingMode mode) const {
    checkDecimals(decimals);
    // произведение имеет масштаб 2 * kScale
    Units product = units_ * factor.units_;
    Units rounded = roundedDivide(product, pow10(2 * kScale - decimals), mode);
    return fromUnits(rounded * pow10(kScale - decimals));
}

Amount Amount::divide(const Amount& divisor, int decimals, RoundingMode mode) const {
    checkDecimals(decimals);
    if (divisor.isZero()) {
        throw std::domain_error("division by zero amount");
    }
    Units rounded = roundedDivide(units_ * pow10(decimals), divisor.units_, mode);
    return fromUnits(rounded * pow10(kScale - decimals));
}

} // namespace ledger::domain
