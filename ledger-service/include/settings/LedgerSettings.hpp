#pragma once

#include <cstdlib>
#include <string>
#include <stdexcept>
#include <utility>

namespace accounting::settings {

/**
 * @brief Настройки ядра учёта
 *
 * Читает из ENV:
 * - LEDGER_STORAGE (default: postgres) - postgres | memory
 * - LEDGER_DEFAULT_PAGE_SIZE (default: 50)
 * - LEDGER_MAX_PAGE_SIZE (default: 500)
 */
class LedgerSettings {
public:
    LedgerSettings() {
        if (const char* val = std::getenv("LEDGER_STORAGE")) {
            storage_ = val;
        }
        if (const char* val = std::getenv("LEDGER_DEFAULT_PAGE_SIZE")) {
            defaultPageSize_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_MAX_PAGE_SIZE")) {
            maxPageSize_ = std::stoi(val);
        }

        if (storage_ != "postgres" && storage_ != "memory") {
            throw std::invalid_argument("LEDGER_STORAGE must be 'postgres' or 'memory', got: " + storage_);
        }
        if (defaultPageSize_ < 1 || maxPageSize_ < 1) {
            throw std::invalid_argument("Page sizes must be positive");
        }
        if (defaultPageSize_ > maxPageSize_) {
            defaultPageSize_ = maxPageSize_;
        }
    }

    LedgerSettings(std::string storage, int defaultPageSize, int maxPageSize)
        : storage_(std::move(storage)),
          defaultPageSize_(defaultPageSize),
          maxPageSize_(maxPageSize) {}

    std::string getStorage() const { return storage_; }
    bool useInMemoryStorage() const { return storage_ == "memory"; }
    int getDefaultPageSize() const { return defaultPageSize_; }
    int getMaxPageSize() const { return maxPageSize_; }

private:
    std::string storage_ = "postgres";
    int defaultPageSize_ = 50;
    int maxPageSize_ = 500;
};

} // namespace accounting::settings
