#pragma once

#include <boost/di.hpp>
#include <memory>
#include <string>
#include <vector>

// Forward declarations - Ports
namespace accounting::ports::input {
    class IChartOfAccountsService;
    class IJournalEntryService;
    class IInvoicePostingService;
    class ILedgerQueryService;
    class IChartImportService;
}

namespace accounting::ports::output {
    class IEventBus;
}

namespace accounting::settings {
    class DbSettings;
    class LedgerSettings;
}

/**
 * @class LedgerApp
 * @brief Консольное приложение администрирования учёта (ledger-admin)
 *
 * Template Method:
 * 1. loadEnvironment() - разбор аргументов и настроек из ENV
 * 2. configureInjection() - Boost.DI: PostgreSQL или in-memory хранилище
 * 3. execute() - выполнение команды и вывод JSON
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapters: CsvChartReader, LedgerJson
 * - Secondary Adapters: Postgres*Repository / InMemory*Repository, InMemoryEventBus
 */
class LedgerApp
{
public:
    LedgerApp();
    ~LedgerApp();

    /**
     * @brief Выполнить команду
     * @return код завершения процесса
     */
    int run(int argc, char* argv[]);

    /**
     * @brief Остановить событийную шину (graceful shutdown)
     */
    void stop();

protected:
    void loadEnvironment(int argc, char* argv[]);

    /**
     * @brief Настроить Boost.DI контейнер и получить сервисы
     *
     * Биндинги Output Ports выбираются по LEDGER_STORAGE,
     * Input Ports всегда привязаны к Application Services.
     */
    void configureInjection();

    int execute();

private:
    template <typename Injector>
    void resolveServices(Injector& injector);

    int cmdSeed(int64_t tenantId);
    int cmdImport(int64_t tenantId, const std::string& path);
    int cmdAccounts(int64_t tenantId);
    int cmdLedger(int64_t tenantId, int64_t accountId, int page, int pageSize);
    int cmdTrialBalance(int64_t tenantId);
    int cmdDemo(int64_t tenantId);

    void printUsage() const;
    void printStartupBanner() const;

    std::vector<std::string> args_;

    std::shared_ptr<accounting::settings::DbSettings> dbSettings_;
    std::shared_ptr<accounting::settings::LedgerSettings> ledgerSettings_;

    std::shared_ptr<accounting::ports::output::IEventBus> eventBus_;
    std::shared_ptr<accounting::ports::input::IChartOfAccountsService> chartService_;
    std::shared_ptr<accounting::ports::input::IJournalEntryService> journalService_;
    std::shared_ptr<accounting::ports::input::IInvoicePostingService> postingService_;
    std::shared_ptr<accounting::ports::input::ILedgerQueryService> queryService_;
    std::shared_ptr<accounting::ports::input::IChartImportService> importService_;
};
