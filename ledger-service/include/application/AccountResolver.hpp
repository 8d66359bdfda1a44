#pragma once

#include "ports/input/IAccountResolver.hpp"
#include "ports/input/IChartOfAccountsService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IAccountGroupRepository.hpp"
#include "application/resolution/GroupLookupStrategy.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include "utils/Strings.hpp"
#include <KeyedMutex.hpp>
#include <functional>
#include <memory>
#include <iostream>

namespace accounting::application {

/**
 * @brief Разрешение ролей в счета с автосозданием по цепочке стратегий
 *
 * Порядок для каждой роли:
 * 1. существующий счёт нужного типа (привязка к клиенту, имя или код);
 * 2. DetailedGroup по цепочке стратегий ветки;
 * 3. план создания счёта в найденной группе;
 * 4. иначе пробел с описанием недостающей структуры.
 *
 * Счёт дохода никогда не создаётся автоматически.
 */
class AccountResolver : public ports::input::IAccountResolver {
public:
    AccountResolver(
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<ports::output::IAccountGroupRepository> groupRepository,
        std::shared_ptr<ports::input::IChartOfAccountsService> chartService
    ) : accountRepository_(std::move(accountRepository))
      , groupRepository_(std::move(groupRepository))
      , chartService_(std::move(chartService))
    {
        std::cout << "[AccountResolver] Created" << std::endl;
    }

    domain::ResolutionPlan plan(int64_t tenantId, const domain::AccountRole& role) override {
        if (role.kind == domain::RoleKind::INCOME) {
            return planIncome(tenantId, role);
        }

        domain::ResolutionPlan result;
        result.role = role;

        RoleRule rule = ruleFor(role);
        result.existing = findExisting(tenantId, rule);
        if (result.existing) {
            return result;
        }

        for (const auto& strategy : rule.chain) {
            auto group = strategy->find(tenantId, *groupRepository_);
            if (!group) {
                continue;
            }

            domain::ProvisioningPlan provision;
            provision.detailedGroupId = group->id;
            provision.groupCode = group->code;
            provision.accountName = rule.accountName;
            provision.accountCode = pickCode(tenantId, rule);
            provision.description = rule.description;
            provision.isSystemAccount = rule.isSystemAccount;
            if (role.kind == domain::RoleKind::ENTITY_RECEIVABLE) {
                provision.entityId = role.entityId;
            }
            provision.strategy = strategy->name();
            result.provision = provision;
            return result;
        }

        domain::MissingAccount gap;
        gap.role = domain::toString(role.kind);
        gap.dependency = "No " + domain::toString(rule.elementKind) +
                         " group with a detailed group to hold '" + rule.accountName + "'";
        gap.guidance = rule.guidance;
        result.gap = gap;
        return result;
    }

    domain::Account materialize(int64_t tenantId, const domain::ResolutionPlan& plan) override {
        if (plan.existing) {
            return *plan.existing;
        }
        if (plan.gap || !plan.provision) {
            throw domain::MissingAccountError({plan.gap.value_or(domain::MissingAccount{
                domain::toString(plan.role.kind), "Unresolved account role", "Run account resolution again"})});
        }

        auto guard = provisionLocks_.lock(provisionKey(tenantId, plan.role));

        // Счёт мог появиться между plan() и materialize()
        if (plan.role.kind != domain::RoleKind::INCOME) {
            if (auto existing = findExisting(tenantId, ruleFor(plan.role))) {
                return *existing;
            }
        }

        const auto& provision = *plan.provision;
        domain::AccountOptions options;
        options.description = provision.description;
        options.entityId = provision.entityId;
        options.isSystemAccount = provision.isSystemAccount;
        if (!provision.accountCode.empty()) {
            options.accountCode = provision.accountCode;
        }

        std::cout << "[AccountResolver] Provisioning '" << provision.accountName
                  << "' under " << provision.groupCode << " via " << provision.strategy << std::endl;

        try {
            return chartService_->createAccount(
                tenantId, provision.detailedGroupId, provision.accountName, domain::Money(), options);
        } catch (const domain::DuplicateCodeError& e) {
            std::cerr << "[AccountResolver] " << e.what() << ", falling back to generated code" << std::endl;
            options.accountCode.reset();
            return chartService_->createAccount(
                tenantId, provision.detailedGroupId, provision.accountName, domain::Money(), options);
        }
    }

    domain::Account resolve(int64_t tenantId, const domain::AccountRole& role) override {
        return materialize(tenantId, plan(tenantId, role));
    }

private:
    /**
     * @brief Правила поиска и создания счёта для одной роли
     */
    struct RoleRule {
        domain::AccountType accountType;
        domain::GroupKind elementKind;
        std::function<int(const domain::Account&)> score;   ///< 0 = не подходит, больше = лучше
        resolution::GroupLookupChain chain;
        std::string accountName;
        std::vector<std::string> preferredCodes;             ///< первый свободный, иначе генерация
        std::string description;
        bool isSystemAccount = false;
        std::string guidance;
    };

    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<ports::output::IAccountGroupRepository> groupRepository_;
    std::shared_ptr<ports::input::IChartOfAccountsService> chartService_;
    KeyedMutex provisionLocks_;

    static constexpr const char* kDefaultIncomeCode = "4000";
    static constexpr const char* kReceivableCodePrefix = "1210-";

    RoleRule ruleFor(const domain::AccountRole& role) const {
        using K = domain::GroupKind;
        using resolution::DetailedGroupByNameStrategy;
        using resolution::DetailedUnderSubElementStrategy;
        using resolution::FirstDetailedInElementStrategy;

        RoleRule rule;
        switch (role.kind) {
            case domain::RoleKind::ENTITY_RECEIVABLE: {
                int64_t entityId = role.entityId;
                std::string entityName = utils::Strings::trim(role.entityName);
                std::string receivableName = (entityName.empty() ? "Entity " + std::to_string(entityId) : entityName)
                                             + " - Receivable";

                rule.accountType = domain::AccountType::ASSET;
                rule.elementKind = K::ASSETS;
                rule.score = [entityId, entityName, receivableName](const domain::Account& a) {
                    if (a.entityId) return *a.entityId == entityId ? 2 : 0;
                    if (!entityName.empty() &&
                        (utils::Strings::equalsIgnoreCase(a.accountName, entityName) ||
                         utils::Strings::equalsIgnoreCase(a.accountName, receivableName))) {
                        return 1;
                    }
                    return 0;
                };
                rule.chain = {
                    std::make_shared<DetailedGroupByNameStrategy>(
                        K::ASSETS, std::vector<K>{K::TRADE_DEBTORS}, std::vector<std::string>{"receivable", "debtor"}),
                    std::make_shared<DetailedUnderSubElementStrategy>(K::ASSETS, std::vector<K>{K::CURRENT_ASSETS}),
                    std::make_shared<FirstDetailedInElementStrategy>(K::ASSETS),
                };
                rule.accountName = receivableName;
                rule.preferredCodes = {kReceivableCodePrefix + std::to_string(entityId)};
                for (int n = 2; n <= 9; ++n) {
                    rule.preferredCodes.push_back(kReceivableCodePrefix + std::to_string(entityId) + "-" + std::to_string(n));
                }
                rule.description = "Accounts receivable for client: " +
                                   (entityName.empty() ? std::to_string(entityId) : entityName);
                rule.guidance = "Create an Assets element group with a detailed group such as Trade Debtors";
                break;
            }

            case domain::RoleKind::TAX_PAYABLE:
                rule.accountType = domain::AccountType::LIABILITY;
                rule.elementKind = K::LIABILITIES;
                rule.score = [](const domain::Account& a) {
                    if (a.accountCode == "2200") return 2;
                    return utils::Strings::containsIgnoreCase(a.accountName, "tax") ? 1 : 0;
                };
                rule.chain = {
                    std::make_shared<DetailedGroupByNameStrategy>(
                        K::LIABILITIES, std::vector<K>{K::ACCRUED_CHARGES, K::OTHER_PAYABLES},
                        std::vector<std::string>{"tax"}),
                    std::make_shared<DetailedUnderSubElementStrategy>(K::LIABILITIES, std::vector<K>{K::CURRENT_LIABILITIES}),
                    std::make_shared<FirstDetailedInElementStrategy>(K::LIABILITIES),
                };
                rule.accountName = "Tax Payable";
                rule.preferredCodes = {"2200"};
                rule.description = "Tax collected on invoices";
                rule.isSystemAccount = true;
                rule.guidance = "Create a Liabilities element group with a detailed group such as Accrued Charges";
                break;

            case domain::RoleKind::DISCOUNT_ALLOWED:
                rule.accountType = domain::AccountType::EXPENSE;
                rule.elementKind = K::EXPENSES;
                rule.score = [](const domain::Account& a) {
                    return utils::Strings::containsIgnoreCase(a.accountName, "discount") ? 1 : 0;
                };
                rule.chain = {
                    std::make_shared<DetailedGroupByNameStrategy>(
                        K::EXPENSES, std::vector<K>{}, std::vector<std::string>{"discount"}),
                    std::make_shared<DetailedUnderSubElementStrategy>(
                        K::EXPENSES, std::vector<K>{K::COST_OF_SALES, K::COST_OF_SERVICE_REVENUE}),
                    std::make_shared<FirstDetailedInElementStrategy>(K::EXPENSES),
                };
                rule.accountName = "Discount Allowed";
                rule.preferredCodes = {"5100"};
                rule.description = "Discounts granted to clients on invoices";
                rule.isSystemAccount = true;
                rule.guidance = "Create an Expenses element group with at least one detailed group";
                break;

            case domain::RoleKind::CASH_OR_BANK: {
                bool cash = role.paymentMethod == domain::PaymentMethod::CASH;
                std::string keyword = cash ? "cash" : "bank";
                std::string code = cash ? "1110" : "1100";

                rule.accountType = domain::AccountType::ASSET;
                rule.elementKind = K::ASSETS;
                rule.score = [keyword, code](const domain::Account& a) {
                    if (a.accountCode == code) return 2;
                    return utils::Strings::containsIgnoreCase(a.accountName, keyword) ? 1 : 0;
                };
                rule.chain = {
                    std::make_shared<DetailedGroupByNameStrategy>(
                        K::ASSETS, std::vector<K>{K::CASH_BANK_BALANCES}, std::vector<std::string>{"cash", "bank"}),
                    std::make_shared<DetailedUnderSubElementStrategy>(K::ASSETS, std::vector<K>{K::CURRENT_ASSETS}),
                    std::make_shared<FirstDetailedInElementStrategy>(K::ASSETS),
                };
                rule.accountName = cash ? "Cash" : "Bank";
                rule.preferredCodes = {code};
                rule.description = cash ? "Cash on hand" : "Main bank account";
                rule.isSystemAccount = true;
                rule.guidance = "Create an Assets element group with a detailed group such as Cash & Bank Balances";
                break;
            }

            case domain::RoleKind::INCOME:
                rule.accountType = domain::AccountType::REVENUE;
                rule.elementKind = K::INCOMES;
                rule.score = [](const domain::Account&) { return 0; };
                break;
        }
        return rule;
    }

    /**
     * @brief Лучший подходящий счёт типа роли; активные важнее неактивных
     */
    std::optional<domain::Account> findExisting(int64_t tenantId, const RoleRule& rule) {
        std::optional<domain::Account> best;
        int bestScore = 0;
        for (const auto& account : accountRepository_->findByType(tenantId, rule.accountType)) {
            int score = rule.score(account);
            if (score == 0) continue;
            score = score * 2 + (account.isActive ? 1 : 0);
            if (score > bestScore) {
                best = account;
                bestScore = score;
            }
        }
        return best;
    }

    std::string pickCode(int64_t tenantId, const RoleRule& rule) {
        for (const auto& code : rule.preferredCodes) {
            if (!accountRepository_->existsCode(tenantId, code)) {
                return code;
            }
        }
        return "";
    }

    /**
     * @brief Доход: явный выбор, иначе активный счёт 4000, иначе единственный активный доходный счёт
     */
    domain::ResolutionPlan planIncome(int64_t tenantId, const domain::AccountRole& role) {
        domain::ResolutionPlan result;
        result.role = role;

        domain::MissingAccount gap;
        gap.role = domain::toString(role.kind);

        if (role.selectedAccountId) {
            auto selected = accountRepository_->findById(tenantId, *role.selectedAccountId);
            if (!selected) {
                gap.dependency = "Selected income account " + std::to_string(*role.selectedAccountId) + " does not exist";
                gap.guidance = "Select an existing revenue account";
                result.gap = gap;
            } else if (selected->accountType != domain::AccountType::REVENUE) {
                gap.dependency = "Selected account " + selected->accountCode + " is not a revenue account";
                gap.guidance = "Select an account under the Incomes element group";
                result.gap = gap;
            } else {
                result.existing = selected;
            }
            return result;
        }

        auto revenue = accountRepository_->findByType(tenantId, domain::AccountType::REVENUE);
        for (const auto& account : revenue) {
            if (account.isActive && account.accountCode == kDefaultIncomeCode) {
                result.existing = account;
                return result;
            }
        }

        std::vector<domain::Account> active;
        for (const auto& account : revenue) {
            if (account.isActive) active.push_back(account);
        }
        if (active.size() == 1) {
            result.existing = active.front();
            return result;
        }

        gap.dependency = active.empty()
            ? "No revenue account exists"
            : "No default income account (code 4000) and " + std::to_string(active.size()) + " revenue accounts to choose from";
        gap.guidance = "Select an income account when approving, or create a revenue account with code 4000";
        result.gap = gap;
        return result;
    }

    static std::string provisionKey(int64_t tenantId, const domain::AccountRole& role) {
        std::string key = std::to_string(tenantId) + ":" + domain::toString(role.kind);
        if (role.kind == domain::RoleKind::ENTITY_RECEIVABLE) {
            key += ":" + std::to_string(role.entityId);
        } else if (role.kind == domain::RoleKind::CASH_OR_BANK) {
            key += role.paymentMethod == domain::PaymentMethod::CASH ? ":cash" : ":bank";
        }
        return key;
    }
};

} // namespace accounting::application
