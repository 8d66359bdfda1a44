#pragma once

#include "domain/ChartImport.hpp"
#include <vector>
#include <cstdint>

namespace accounting::ports::input {

/**
 * @brief Массовый импорт плана счетов
 */
class IChartImportService {
public:
    virtual ~IChartImportService() = default;

    /**
     * @brief Импортировать строки; ошибка одной строки не прерывает пакет
     */
    virtual domain::ImportReport importChart(int64_t tenantId, const std::vector<domain::ImportRow>& rows) = 0;
};

} // namespace accounting::ports::input
