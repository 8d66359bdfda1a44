#pragma once

#include "ports/output/IAccountGroupRepository.hpp"
#include "domain/AccountGroup.hpp"
#include "utils/Strings.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <algorithm>

namespace accounting::application::resolution {

/**
 * @brief Одна ступень поиска DetailedGroup для создаваемого счёта
 *
 * Резолвер перебирает стратегии по порядку и берёт первую найденную
 * группу. Новая ступень добавляется в список без изменения вызывающего кода.
 */
class IGroupLookupStrategy {
public:
    virtual ~IGroupLookupStrategy() = default;

    virtual std::optional<domain::AccountGroup> find(
        int64_t tenantId,
        ports::output::IAccountGroupRepository& groups
    ) const = 0;

    /**
     * @brief Имя для логов и плана ("detailed-by-name:trade_debtors")
     */
    virtual std::string name() const = 0;
};

using GroupLookupChain = std::vector<std::shared_ptr<IGroupLookupStrategy>>;

namespace detail {

/**
 * @brief SubElementGroup ветки elementKind, в порядке создания
 */
inline std::vector<domain::AccountGroup> subElementsOf(
    int64_t tenantId,
    ports::output::IAccountGroupRepository& groups,
    domain::GroupKind elementKind
) {
    std::vector<domain::AccountGroup> result;
    for (const auto& element : groups.findByLevel(tenantId, domain::GroupLevel::ELEMENT)) {
        if (element.kind != elementKind) continue;
        for (auto& sub : groups.findChildren(tenantId, element.id)) {
            if (sub.level == domain::GroupLevel::SUB_ELEMENT) {
                result.push_back(std::move(sub));
            }
        }
    }
    return result;
}

inline std::vector<domain::AccountGroup> detailedOf(
    int64_t tenantId,
    ports::output::IAccountGroupRepository& groups,
    const domain::AccountGroup& subElement
) {
    std::vector<domain::AccountGroup> result;
    for (auto& detailed : groups.findChildren(tenantId, subElement.id)) {
        if (detailed.level == domain::GroupLevel::DETAILED && detailed.isActive) {
            result.push_back(std::move(detailed));
        }
    }
    return result;
}

} // namespace detail

/**
 * @brief DetailedGroup ветки, чей вид входит в kinds или имя содержит ключевое слово
 */
class DetailedGroupByNameStrategy : public IGroupLookupStrategy {
public:
    DetailedGroupByNameStrategy(
        domain::GroupKind elementKind,
        std::vector<domain::GroupKind> kinds,
        std::vector<std::string> keywords
    ) : elementKind_(elementKind), kinds_(std::move(kinds)), keywords_(std::move(keywords)) {}

    std::optional<domain::AccountGroup> find(
        int64_t tenantId,
        ports::output::IAccountGroupRepository& groups
    ) const override {
        auto subs = detail::subElementsOf(tenantId, groups, elementKind_);

        // Предопределённые виды имеют приоритет над совпадением по имени
        for (const auto& kind : kinds_) {
            for (const auto& sub : subs) {
                for (const auto& detailed : detail::detailedOf(tenantId, groups, sub)) {
                    if (detailed.kind == kind) return detailed;
                }
            }
        }

        for (const auto& keyword : keywords_) {
            for (const auto& sub : subs) {
                for (const auto& detailed : detail::detailedOf(tenantId, groups, sub)) {
                    if (utils::Strings::containsIgnoreCase(detailed.name(), keyword) ||
                        utils::Strings::containsIgnoreCase(detailed.description, keyword)) {
                        return detailed;
                    }
                }
            }
        }
        return std::nullopt;
    }

    std::string name() const override {
        std::string result = "detailed-by-name:";
        for (const auto& kind : kinds_) result += domain::toString(kind) + ",";
        for (const auto& keyword : keywords_) result += keyword + ",";
        if (!result.empty() && result.back() == ',') result.pop_back();
        return result;
    }

private:
    domain::GroupKind elementKind_;
    std::vector<domain::GroupKind> kinds_;
    std::vector<std::string> keywords_;
};

/**
 * @brief Любая DetailedGroup под SubElementGroup одного из видов subKinds
 */
class DetailedUnderSubElementStrategy : public IGroupLookupStrategy {
public:
    DetailedUnderSubElementStrategy(domain::GroupKind elementKind, std::vector<domain::GroupKind> subKinds)
        : elementKind_(elementKind), subKinds_(std::move(subKinds)) {}

    std::optional<domain::AccountGroup> find(
        int64_t tenantId,
        ports::output::IAccountGroupRepository& groups
    ) const override {
        auto subs = detail::subElementsOf(tenantId, groups, elementKind_);
        for (const auto& kind : subKinds_) {
            for (const auto& sub : subs) {
                if (sub.kind != kind) continue;
                auto detailed = detail::detailedOf(tenantId, groups, sub);
                if (!detailed.empty()) return detailed.front();
            }
        }
        return std::nullopt;
    }

    std::string name() const override {
        std::string result = "under-sub-element:";
        for (const auto& kind : subKinds_) result += domain::toString(kind) + ",";
        result.pop_back();
        return result;
    }

private:
    domain::GroupKind elementKind_;
    std::vector<domain::GroupKind> subKinds_;
};

/**
 * @brief Первая DetailedGroup где угодно под ElementGroup ветки
 */
class FirstDetailedInElementStrategy : public IGroupLookupStrategy {
public:
    explicit FirstDetailedInElementStrategy(domain::GroupKind elementKind)
        : elementKind_(elementKind) {}

    std::optional<domain::AccountGroup> find(
        int64_t tenantId,
        ports::output::IAccountGroupRepository& groups
    ) const override {
        for (const auto& sub : detail::subElementsOf(tenantId, groups, elementKind_)) {
            auto detailed = detail::detailedOf(tenantId, groups, sub);
            if (!detailed.empty()) return detailed.front();
        }
        return std::nullopt;
    }

    std::string name() const override {
        return "first-in-element:" + domain::toString(elementKind_);
    }

private:
    domain::GroupKind elementKind_;
};

} // namespace accounting::application::resolution
