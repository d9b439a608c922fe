#pragma once

#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ledger::utils {

/**
 * @brief Генератор идентификаторов событий (UUID v4)
 *
 * @note Thread-safe: генератор thread_local
 */
class IdGenerator {
public:
    static std::string uuid() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<unsigned int> byte(0, 255);

        std::array<uint8_t, 16> bytes{};
        for (auto& b : bytes) {
            b = static_cast<uint8_t>(byte(gen));
        }
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // variant

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }
};

} // namespace ledger::utils
