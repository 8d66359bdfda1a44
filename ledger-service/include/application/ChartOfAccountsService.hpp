#pragma once

#include "ports/input/IChartOfAccountsService.hpp"
#include "ports/output/IAccountGroupRepository.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IJournalRepository.hpp"
#include "ports/output/IEventBus.hpp"
#include "application/StandardChart.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include "domain/events/AccountCreatedEvent.hpp"
#include "utils/Strings.hpp"
#include <memory>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <map>

namespace accounting::application {

/**
 * @brief Сервис плана счетов
 *
 * Реализует IChartOfAccountsService, координирует работу между:
 * - IAccountGroupRepository (иерархия групп)
 * - IAccountRepository (счета)
 * - IJournalRepository (проверка ссылок строк перед удалением счёта)
 * - IEventBus (публикация account.created)
 */
class ChartOfAccountsService : public ports::input::IChartOfAccountsService {
public:
    ChartOfAccountsService(
        std::shared_ptr<ports::output::IAccountGroupRepository> groupRepository,
        std::shared_ptr<ports::output::IAccountRepository> accountRepository,
        std::shared_ptr<ports::output::IJournalRepository> journalRepository,
        std::shared_ptr<ports::output::IEventBus> eventBus
    ) : groupRepository_(std::move(groupRepository))
      , accountRepository_(std::move(accountRepository))
      , journalRepository_(std::move(journalRepository))
      , eventBus_(std::move(eventBus))
    {
        std::cout << "[ChartOfAccountsService] Created" << std::endl;
    }

    // ================================================================
    // Группы
    // ================================================================

    domain::AccountGroup createGroup(const ports::input::CreateGroupRequest& request) override {
        if (!domain::isAllowedAt(request.kind, request.level)) {
            throw domain::ValidationError("Group kind '" + domain::toString(request.kind) +
                "' is not allowed at level " + domain::toString(request.level));
        }

        std::string customName = utils::Strings::trim(request.customName);
        if (request.kind == domain::GroupKind::CUSTOM && customName.empty()) {
            throw domain::ValidationError("Custom group requires a name");
        }

        domain::AccountGroup group;
        group.tenantId = request.tenantId;
        group.level = request.level;
        group.kind = request.kind;
        group.customName = request.kind == domain::GroupKind::CUSTOM ? customName : "";
        group.description = request.description;
        group.isActive = true;
        group.createdAt = domain::Timestamp::now();

        if (request.level == domain::GroupLevel::MAIN) {
            if (request.parentId) {
                throw domain::ValidationError("Main group cannot have a parent");
            }
            group.code = domain::codeSuffix(request.kind);
        } else {
            auto parent = requireParent(request);
            group.parentId = parent.id;
            if (request.kind == domain::GroupKind::CUSTOM) {
                group.code = generateCustomCode(request.tenantId, parent.code);
            } else {
                group.code = parent.code + "-" + domain::codeSuffix(request.kind);
            }
        }

        if (request.kind != domain::GroupKind::CUSTOM &&
            groupRepository_->existsCode(request.tenantId, group.code)) {
            throw domain::DuplicateCodeError(group.code);
        }

        auto saved = groupRepository_->insert(group);
        std::cout << "[ChartOfAccountsService] Created group " << saved.code
                  << " (" << saved.label() << ") tenant=" << saved.tenantId << std::endl;
        return saved;
    }

    void deleteGroup(int64_t tenantId, int64_t groupId) override {
        auto group = groupRepository_->findById(tenantId, groupId);
        if (!group) {
            throw domain::NotFoundError("AccountGroup", groupId);
        }

        if (!groupRepository_->findChildren(tenantId, groupId).empty()) {
            throw domain::ConstraintError("Group " + group->code + " has child groups");
        }

        if (group->level == domain::GroupLevel::DETAILED &&
            accountRepository_->countByDetailedGroup(tenantId, groupId) > 0) {
            throw domain::ConstraintError("Group " + group->code + " has accounts");
        }

        groupRepository_->deleteById(tenantId, groupId);
        std::cout << "[ChartOfAccountsService] Deleted group " << group->code << std::endl;
    }

    std::optional<domain::AccountGroup> getGroup(int64_t tenantId, int64_t groupId) override {
        return groupRepository_->findById(tenantId, groupId);
    }

    std::vector<domain::AccountGroup> listGroups(
        int64_t tenantId,
        domain::GroupLevel level,
        std::optional<int64_t> parentId
    ) override {
        if (!parentId) {
            return groupRepository_->findByLevel(tenantId, level);
        }

        std::vector<domain::AccountGroup> result;
        for (auto& group : groupRepository_->findChildren(tenantId, *parentId)) {
            if (group.level == level) {
                result.push_back(std::move(group));
            }
        }
        return result;
    }

    domain::GroupPath getGroupPath(int64_t tenantId, int64_t detailedGroupId) override {
        domain::GroupPath path;
        path.detailed = requireGroup(tenantId, detailedGroupId);
        if (path.detailed.level != domain::GroupLevel::DETAILED) {
            throw domain::ValidationError("Group " + path.detailed.code + " is not a detailed group");
        }
        path.subElement = requireGroup(tenantId, path.detailed.parentId.value_or(0));
        path.element = requireGroup(tenantId, path.subElement.parentId.value_or(0));
        path.main = requireGroup(tenantId, path.element.parentId.value_or(0));
        return path;
    }

    // ================================================================
    // Счета
    // ================================================================

    domain::Account createAccount(
        int64_t tenantId,
        int64_t detailedGroupId,
        const std::string& accountName,
        const domain::Money& openingBalance,
        const domain::AccountOptions& options
    ) override {
        std::string name = utils::Strings::trim(accountName);
        if (name.empty()) {
            throw domain::ValidationError("Account name is required");
        }

        auto path = getGroupPath(tenantId, detailedGroupId);
        auto accountType = domain::accountTypeFor(path.element.kind);
        if (!accountType) {
            throw domain::ValidationError("Group " + path.element.code + " does not determine an account type");
        }

        domain::Account account;
        account.tenantId = tenantId;
        account.detailedGroupId = detailedGroupId;
        account.accountName = name;
        account.description = options.description;
        account.accountType = *accountType;
        account.entityId = options.entityId;
        account.isSystemAccount = options.isSystemAccount;
        account.isActive = true;
        account.openingBalance = openingBalance;
        account.currentBalance = openingBalance;
        account.createdAt = domain::Timestamp::now();

        if (options.accountCode && !utils::Strings::trim(*options.accountCode).empty()) {
            account.accountCode = utils::Strings::trim(*options.accountCode);
            if (accountRepository_->existsCode(tenantId, account.accountCode)) {
                throw domain::DuplicateCodeError(account.accountCode);
            }
        } else {
            account.accountCode = generateAccountCode(tenantId, path);
        }

        auto saved = accountRepository_->insert(account);
        std::cout << "[ChartOfAccountsService] Created account " << saved.accountCode
                  << " '" << saved.accountName << "' type=" << domain::toString(saved.accountType)
                  << " tenant=" << tenantId << std::endl;

        publishAccountCreated(saved);
        return saved;
    }

    void deleteAccount(int64_t tenantId, int64_t accountId) override {
        auto account = requireAccount(tenantId, accountId);

        if (account.isSystemAccount) {
            throw domain::SystemAccountProtectionError(
                "System account " + account.accountCode + " cannot be deleted");
        }

        if (journalRepository_->countLinesForAccount(tenantId, accountId) > 0) {
            throw domain::ConstraintError(
                "Account " + account.accountCode + " is referenced by journal entry lines");
        }

        accountRepository_->deleteById(tenantId, accountId);
        std::cout << "[ChartOfAccountsService] Deleted account " << account.accountCode << std::endl;
    }

    domain::Account renameAccount(int64_t tenantId, int64_t accountId, const std::string& accountName) override {
        auto account = requireAccount(tenantId, accountId);

        if (account.isSystemAccount) {
            throw domain::SystemAccountProtectionError(
                "System account " + account.accountCode + " cannot be renamed");
        }

        std::string name = utils::Strings::trim(accountName);
        if (name.empty()) {
            throw domain::ValidationError("Account name is required");
        }

        account.accountName = name;
        accountRepository_->update(account);
        return account;
    }

    domain::Account setAccountActive(int64_t tenantId, int64_t accountId, bool isActive) override {
        auto account = requireAccount(tenantId, accountId);
        account.isActive = isActive;
        accountRepository_->update(account);
        return account;
    }

    std::optional<domain::Account> getAccount(int64_t tenantId, int64_t accountId) override {
        return accountRepository_->findById(tenantId, accountId);
    }

    std::optional<domain::Account> findAccountByCode(int64_t tenantId, const std::string& code) override {
        return accountRepository_->findByCode(tenantId, code);
    }

    // ================================================================
    // Стандартный план
    // ================================================================

    ports::input::SeedSummary seedStandardChart(int64_t tenantId) override {
        ports::input::SeedSummary summary;
        std::map<std::string, int64_t> detailedByPath;

        for (const auto& main : StandardChart::groups()) {
            seedGroup(tenantId, domain::GroupLevel::MAIN, std::nullopt, main, "", detailedByPath, summary);
        }

        for (const auto& standard : StandardChart::accounts()) {
            if (accountRepository_->existsCode(tenantId, standard.code)) {
                continue;
            }

            auto it = detailedByPath.find(joinPath(standard.path));
            if (it == detailedByPath.end()) {
                throw domain::ValidationError("Standard account " + standard.code + " has no group");
            }

            domain::AccountOptions options;
            options.accountCode = standard.code;
            options.description = standard.description;
            options.isSystemAccount = true;
            createAccount(tenantId, it->second, standard.name, domain::Money(), options);
            ++summary.accountsCreated;
        }

        std::cout << "[ChartOfAccountsService] Seeded tenant " << tenantId << ": "
                  << summary.groupsCreated << " groups, "
                  << summary.accountsCreated << " accounts" << std::endl;
        return summary;
    }

private:
    std::shared_ptr<ports::output::IAccountGroupRepository> groupRepository_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepository_;
    std::shared_ptr<ports::output::IJournalRepository> journalRepository_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;

    domain::AccountGroup requireGroup(int64_t tenantId, int64_t groupId) {
        auto group = groupRepository_->findById(tenantId, groupId);
        if (!group) {
            throw domain::NotFoundError("AccountGroup", groupId);
        }
        return *group;
    }

    domain::Account requireAccount(int64_t tenantId, int64_t accountId) {
        auto account = accountRepository_->findById(tenantId, accountId);
        if (!account) {
            throw domain::NotFoundError("Account", accountId);
        }
        return *account;
    }

    domain::AccountGroup requireParent(const ports::input::CreateGroupRequest& request) {
        if (!request.parentId) {
            throw domain::ValidationError(domain::toString(request.level) + " requires a parent group");
        }

        auto parent = requireGroup(request.tenantId, *request.parentId);
        if (parent.level != domain::parentLevel(request.level)) {
            throw domain::ValidationError("Parent " + parent.code + " is a " +
                domain::toString(parent.level) + ", expected a parent for " + domain::toString(request.level));
        }

        if (request.level == domain::GroupLevel::ELEMENT) {
            auto required = domain::requiredMainGroup(request.kind);
            if (required && parent.kind != *required) {
                throw domain::ValidationError("Element group '" + domain::toString(request.kind) +
                    "' must be placed under " + domain::toString(*required));
            }
        }
        return parent;
    }

    /**
     * @brief parentCode + "-" + шесть последних цифр epoch ms, с шагом +1 до свободного
     */
    std::string generateCustomCode(int64_t tenantId, const std::string& parentCode) {
        int64_t tail = domain::Timestamp::now().toUnixMillis() % 1000000;
        for (int attempt = 0; attempt < 1000000; ++attempt) {
            std::ostringstream ss;
            ss << parentCode << "-" << std::setw(6) << std::setfill('0') << tail;
            if (!groupRepository_->existsCode(tenantId, ss.str())) {
                return ss.str();
            }
            tail = (tail + 1) % 1000000;
        }
        throw domain::ConstraintError("No free custom group code under " + parentCode);
    }

    /**
     * @brief "{element}.{subElement}.{detailed}.{NNN}", NNN = число счетов группы + 1
     */
    std::string generateAccountCode(int64_t tenantId, const domain::GroupPath& path) {
        std::string base = path.element.segment() + "." + path.subElement.segment() + "." +
                           path.detailed.segment();
        size_t sequence = accountRepository_->countByDetailedGroup(tenantId, path.detailed.id) + 1;

        while (true) {
            std::ostringstream ss;
            ss << base << "." << std::setw(3) << std::setfill('0') << sequence;
            if (!accountRepository_->existsCode(tenantId, ss.str())) {
                return ss.str();
            }
            ++sequence;
        }
    }

    void publishAccountCreated(const domain::Account& account) {
        domain::AccountCreatedEvent event;
        event.tenantId = account.tenantId;
        event.accountId = account.id;
        event.detailedGroupId = account.detailedGroupId;
        event.accountCode = account.accountCode;
        event.accountName = account.accountName;
        event.accountType = account.accountType;
        event.isSystemAccount = account.isSystemAccount;
        eventBus_->publish(event);
    }

    void seedGroup(
        int64_t tenantId,
        domain::GroupLevel level,
        std::optional<int64_t> parentId,
        const StandardGroup& standard,
        const std::string& parentPath,
        std::map<std::string, int64_t>& detailedByPath,
        ports::input::SeedSummary& summary
    ) {
        std::string name = standard.kind == domain::GroupKind::CUSTOM
            ? standard.customName
            : domain::toString(standard.kind);

        auto group = findSeededGroup(tenantId, level, parentId, standard);
        if (!group) {
            ports::input::CreateGroupRequest request;
            request.tenantId = tenantId;
            request.level = level;
            request.parentId = parentId;
            request.kind = standard.kind;
            request.customName = standard.customName;
            group = createGroup(request);
            ++summary.groupsCreated;
        }

        std::string path = parentPath.empty() ? name : parentPath + "/" + name;
        if (level == domain::GroupLevel::DETAILED) {
            detailedByPath[path] = group->id;
            return;
        }

        auto childLevel = static_cast<domain::GroupLevel>(static_cast<int>(level) + 1);
        for (const auto& child : standard.children) {
            seedGroup(tenantId, childLevel, group->id, child, path, detailedByPath, summary);
        }
    }

    std::optional<domain::AccountGroup> findSeededGroup(
        int64_t tenantId,
        domain::GroupLevel level,
        std::optional<int64_t> parentId,
        const StandardGroup& standard
    ) {
        for (const auto& candidate : listGroups(tenantId, level, parentId)) {
            if (candidate.kind != standard.kind) {
                continue;
            }
            if (standard.kind != domain::GroupKind::CUSTOM ||
                utils::Strings::equalsIgnoreCase(candidate.customName, standard.customName)) {
                return candidate;
            }
        }
        return std::nullopt;
    }

    static std::string joinPath(const std::vector<std::string>& parts) {
        std::string result;
        for (const auto& part : parts) {
            result += result.empty() ? part : "/" + part;
        }
        return result;
    }
};

} // namespace accounting::application
