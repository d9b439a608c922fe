#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Тип счёта
 *
 * USER - счёт участника; остальные - системные счета тенанта.
 */
enum class AccountType {
    USER,
    TREASURY,   ///< эмитент, пополняется автоматически
    BURN,       ///< изъятие из обращения
    MINT,       ///< контрсчёт пополнений казны
    BANK,       ///< средства на банковских вкладах
    ESCROW      ///< ставки открытых событий
};

inline std::string toString(AccountType type) {
    switch (type) {
        case AccountType::USER: return "user";
        case AccountType::TREASURY: return "treasury";
        case AccountType::BURN: return "burn";
        case AccountType::MINT: return "mint";
        case AccountType::BANK: return "bank";
        case AccountType::ESCROW: return "escrow";
        default: return "unknown";
    }
}

inline AccountType parseAccountType(const std::string& str) {
    if (str == "user") return AccountType::USER;
    if (str == "treasury") return AccountType::TREASURY;
    if (str == "burn") return AccountType::BURN;
    if (str == "mint") return AccountType::MINT;
    if (str == "bank") return AccountType::BANK;
    if (str == "escrow") return AccountType::ESCROW;
    throw std::invalid_argument("Unknown account type: " + str);
}

/// Счета, которым разрешён отрицательный баланс
inline bool isOverdraftExempt(AccountType type) {
    return type == AccountType::TREASURY ||
           type == AccountType::BURN ||
           type == AccountType::MINT;
}

} // namespace ledger::domain
