#pragma once

#include "domain/Money.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>
#include <cstdint>

namespace accounting::domain {

/**
 * @brief Базовое исключение ядра учёта
 */
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Неверные входные данные или недопустимый переход статуса
 */
class ValidationError : public LedgerError {
public:
    explicit ValidationError(const std::string& message)
        : LedgerError(message) {}
};

/**
 * @brief Сущность с данным id не найдена в пределах tenant
 */
class NotFoundError : public LedgerError {
public:
    NotFoundError(const std::string& entity, int64_t id)
        : LedgerError(entity + " " + std::to_string(id) + " not found"),
          entity_(entity), id_(id) {}

    const std::string& entity() const { return entity_; }
    int64_t id() const { return id_; }

private:
    std::string entity_;
    int64_t id_;
};

/**
 * @brief Удаление заблокировано зависимыми группами, счетами или строками
 */
class ConstraintError : public LedgerError {
public:
    explicit ConstraintError(const std::string& message)
        : LedgerError(message) {}
};

/**
 * @brief Документ-источник уже связан с другой проводкой
 */
class DuplicateSourceDocumentError : public ConstraintError {
public:
    DuplicateSourceDocumentError(const std::string& sourceDocument, int64_t sourceDocumentId)
        : ConstraintError("Journal entry for " + sourceDocument + " " +
                          std::to_string(sourceDocumentId) + " already exists") {}
};

/**
 * @brief Попытка переименовать или удалить системный счёт
 */
class SystemAccountProtectionError : public LedgerError {
public:
    explicit SystemAccountProtectionError(const std::string& message)
        : LedgerError(message) {}
};

/**
 * @brief Код группы или счёта уже занят в пределах tenant
 */
class DuplicateCodeError : public LedgerError {
public:
    explicit DuplicateCodeError(const std::string& code)
        : LedgerError("Code already in use: " + code), code_(code) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

/**
 * @brief Сумма дебетов не равна сумме кредитов
 */
class UnbalancedEntryError : public LedgerError {
public:
    UnbalancedEntryError(const Money& totalDebit, const Money& totalCredit)
        : LedgerError("Entry is not balanced: debit " + totalDebit.toString() +
                      " != credit " + totalCredit.toString()),
          totalDebit_(totalDebit), totalCredit_(totalCredit) {}

    const Money& totalDebit() const { return totalDebit_; }
    const Money& totalCredit() const { return totalCredit_; }

private:
    Money totalDebit_;
    Money totalCredit_;
};

/**
 * @brief Пробел в структуре плана счетов, мешающий проводке
 */
struct MissingAccount {
    std::string role;           ///< "entity_receivable", "income", ...
    std::string dependency;     ///< чего именно не хватает
    std::string guidance;       ///< что сделать пользователю
};

/**
 * @brief Не найдены обязательные счета; перечисляет все пробелы сразу
 */
class MissingAccountError : public LedgerError {
public:
    explicit MissingAccountError(std::vector<MissingAccount> missing)
        : LedgerError(buildMessage(missing)), missing_(std::move(missing)) {}

    const std::vector<MissingAccount>& missing() const { return missing_; }

private:
    std::vector<MissingAccount> missing_;

    static std::string buildMessage(const std::vector<MissingAccount>& missing) {
        std::string message = "Missing required accounts:";
        for (const auto& gap : missing) {
            message += " [" + gap.role + ": " + gap.dependency + ". " + gap.guidance + "]";
        }
        return message;
    }
};

/**
 * @brief Проектор построил несбалансированный набор строк (ошибка программы)
 */
class InternalPostingError : public LedgerError {
public:
    explicit InternalPostingError(const std::string& message)
        : LedgerError(message) {}
};

} // namespace accounting::domain
