#pragma once

#include "enums/PaymentMethod.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Поступившая оплата по счёту-фактуре
 */
struct Payment {
    int64_t id = 0;
    int64_t tenantId = 0;
    int64_t invoiceId = 0;
    Timestamp paymentDate;
    Money amount;
    PaymentMethod method = PaymentMethod::BANK_TRANSFER;
    std::string reference;
};

} // namespace accounting::domain
