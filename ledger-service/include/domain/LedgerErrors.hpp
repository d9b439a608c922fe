#pragma once

#include "domain/Amount.hpp"
#include "domain/Types.hpp"
#include <stdexcept>
#include <string>

namespace ledger::domain {

enum class ErrorCode {
    DUPLICATE_ASSET,
    ASSET_NOT_FOUND,
    ACCOUNT_NOT_FOUND,
    INSUFFICIENT_BALANCE,
    UNBALANCED_TRANSACTION,
    DUPLICATE_CLAIM,
    STORAGE_CONFLICT,
    DUPLICATE_TRANSACTION,
    INVALID_AMOUNT,
    NOT_FOUND,
    INVALID_STATE
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::DUPLICATE_ASSET: return "DUPLICATE_ASSET";
        case ErrorCode::ASSET_NOT_FOUND: return "ASSET_NOT_FOUND";
        case ErrorCode::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case ErrorCode::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case ErrorCode::UNBALANCED_TRANSACTION: return "UNBALANCED_TRANSACTION";
        case ErrorCode::DUPLICATE_CLAIM: return "DUPLICATE_CLAIM";
        case ErrorCode::STORAGE_CONFLICT: return "STORAGE_CONFLICT";
        case ErrorCode::DUPLICATE_TRANSACTION: return "DUPLICATE_TRANSACTION";
        case ErrorCode::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::INVALID_STATE: return "INVALID_STATE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Базовое исключение ядра
 *
 * Сообщение - для логов, не для пользователя.
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class DuplicateAsset : public LedgerException {
public:
    DuplicateAsset(const TenantId& tenantId, const std::string& symbol)
        : LedgerException(ErrorCode::DUPLICATE_ASSET,
                          "Asset " + symbol + " already exists in tenant " + tenantId) {}
};

class AssetNotFound : public LedgerException {
public:
    explicit AssetNotFound(const std::string& what)
        : LedgerException(ErrorCode::ASSET_NOT_FOUND, "Asset not found: " + what) {}
};

class AccountNotFound : public LedgerException {
public:
    explicit AccountNotFound(const std::string& what)
        : LedgerException(ErrorCode::ACCOUNT_NOT_FOUND, "Account not found: " + what) {}
};

class InsufficientBalance : public LedgerException {
public:
    InsufficientBalance(AccountId accountId, const Amount& balance, const Amount& required)
        : LedgerException(ErrorCode::INSUFFICIENT_BALANCE,
                          "Insufficient balance on account " + std::to_string(accountId) +
                          ": have " + balance.toString() + ", need " + required.toString())
        , balance_(balance)
        , required_(required) {}

    const Amount& balance() const { return balance_; }
    const Amount& required() const { return required_; }

private:
    Amount balance_;
    Amount required_;
};

class UnbalancedTransaction : public LedgerException {
public:
    UnbalancedTransaction(TransactionId txId, AssetId assetId, const Amount& residual)
        : LedgerException(ErrorCode::UNBALANCED_TRANSACTION,
                          "Transaction " + std::to_string(txId) + " does not net to zero for asset " +
                          std::to_string(assetId) + " (residual " + residual.toString() + ")")
        , transactionId_(txId)
        , assetId_(assetId)
        , residual_(residual) {}

    TransactionId transactionId() const { return transactionId_; }
    AssetId assetId() const { return assetId_; }
    const Amount& residual() const { return residual_; }

private:
    TransactionId transactionId_;
    AssetId assetId_;
    Amount residual_;
};

class DuplicateClaim : public LedgerException {
public:
    explicit DuplicateClaim(const std::string& what)
        : LedgerException(ErrorCode::DUPLICATE_CLAIM, "Already claimed: " + what) {}
};

/// Временный сбой изоляции, операция повторяется целиком
class StorageConflict : public LedgerException {
public:
    explicit StorageConflict(const std::string& what)
        : LedgerException(ErrorCode::STORAGE_CONFLICT, "Storage conflict: " + what) {}
};

/// (kind, idempotencyKey) уже использован
class DuplicateTransaction : public LedgerException {
public:
    DuplicateTransaction(const std::string& kind, const std::string& key, TransactionId existingId)
        : LedgerException(ErrorCode::DUPLICATE_TRANSACTION,
                          "Transaction " + kind + "/" + key + " already recorded as " +
                          std::to_string(existingId))
        , existingId_(existingId) {}

    TransactionId existingId() const { return existingId_; }

private:
    TransactionId existingId_;
};

class InvalidAmount : public LedgerException {
public:
    explicit InvalidAmount(const std::string& what)
        : LedgerException(ErrorCode::INVALID_AMOUNT, "Invalid amount: " + what) {}
};

class NotFound : public LedgerException {
public:
    explicit NotFound(const std::string& what)
        : LedgerException(ErrorCode::NOT_FOUND, "Not found: " + what) {}
};

class InvalidState : public LedgerException {
public:
    explicit InvalidState(const std::string& what)
        : LedgerException(ErrorCode::INVALID_STATE, what) {}
};

} // namespace ledger::domain
