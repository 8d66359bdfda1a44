#pragma once

#include <string>
#include <stdexcept>

namespace accounting::domain {

/**
 * @brief Способ оплаты: определяет, на какой счёт (касса или банк) поступают деньги
 */
enum class PaymentMethod {
    CASH,
    BANK_TRANSFER,
    CREDIT_CARD,
    DIRECT_DEBIT,
    CHEQUE,
    OTHER
};

inline std::string toString(PaymentMethod method) {
    switch (method) {
        case PaymentMethod::CASH:          return "cash";
        case PaymentMethod::BANK_TRANSFER: return "bank_transfer";
        case PaymentMethod::CREDIT_CARD:   return "credit_card";
        case PaymentMethod::DIRECT_DEBIT:  return "direct_debit";
        case PaymentMethod::CHEQUE:        return "cheque";
        case PaymentMethod::OTHER:         return "other";
    }
    return "unknown";
}

inline PaymentMethod paymentMethodFromString(const std::string& str) {
    if (str == "cash")          return PaymentMethod::CASH;
    if (str == "bank_transfer") return PaymentMethod::BANK_TRANSFER;
    if (str == "credit_card")   return PaymentMethod::CREDIT_CARD;
    if (str == "direct_debit")  return PaymentMethod::DIRECT_DEBIT;
    if (str == "cheque")        return PaymentMethod::CHEQUE;
    if (str == "other")         return PaymentMethod::OTHER;
    throw std::invalid_argument("Unknown PaymentMethod: " + str);
}

} // namespace accounting::domain
