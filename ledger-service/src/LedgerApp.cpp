#include "LedgerApp.hpp"

// Primary Adapters
#include "adapters/primary/CsvChartReader.hpp"
#include "adapters/primary/LedgerJson.hpp"

// Application Services
#include "application/ChartOfAccountsService.hpp"
#include "application/AccountResolver.hpp"
#include "application/JournalEntryService.hpp"
#include "application/InvoicePostingService.hpp"
#include "application/LedgerQueryService.hpp"
#include "application/ChartImportService.hpp"

// Secondary Adapters
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerStore.hpp"
#include "adapters/secondary/persistence/InMemoryAccountGroupRepository.hpp"
#include "adapters/secondary/persistence/InMemoryAccountRepository.hpp"
#include "adapters/secondary/persistence/InMemoryJournalRepository.hpp"
#include "adapters/secondary/persistence/PostgresAccountGroupRepository.hpp"
#include "adapters/secondary/persistence/PostgresAccountRepository.hpp"
#include "adapters/secondary/persistence/PostgresJournalRepository.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

#include <fstream>
#include <iostream>

namespace di = boost::di;

using namespace accounting;

// ============================================================================
// LedgerApp Implementation
// ============================================================================

LedgerApp::LedgerApp()
{
    std::cout << "[LedgerApp] Application created" << std::endl;
}

LedgerApp::~LedgerApp()
{
    stop();
    std::cout << "[LedgerApp] Application destroyed" << std::endl;
}

int LedgerApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    if (args_.empty()) {
        printUsage();
        return 2;
    }

    configureInjection();
    eventBus_->start();

    int code = execute();

    stop();
    return code;
}

void LedgerApp::stop()
{
    if (eventBus_) {
        eventBus_->stop();
    }
}

void LedgerApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[LedgerApp] Loading environment..." << std::endl;

    for (int i = 1; i < argc; ++i) {
        args_.emplace_back(argv[i]);
    }

    dbSettings_ = std::make_shared<settings::DbSettings>();
    ledgerSettings_ = std::make_shared<settings::LedgerSettings>();

    std::cout << "[LedgerApp] Storage: " << ledgerSettings_->getStorage() << std::endl;
}

template <typename Injector>
void LedgerApp::resolveServices(Injector& injector)
{
    eventBus_ = injector.template create<std::shared_ptr<ports::output::IEventBus>>();
    chartService_ = injector.template create<std::shared_ptr<ports::input::IChartOfAccountsService>>();
    journalService_ = injector.template create<std::shared_ptr<ports::input::IJournalEntryService>>();
    postingService_ = injector.template create<std::shared_ptr<ports::input::IInvoicePostingService>>();
    queryService_ = injector.template create<std::shared_ptr<ports::input::ILedgerQueryService>>();
    importService_ = injector.template create<std::shared_ptr<ports::input::IChartImportService>>();
}

void LedgerApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

    // ========================================================================
    // Layer 2: Application Services (Input Ports implementations)
    // ========================================================================

    auto services = [this]() {
        return di::make_injector(
            di::bind<settings::DbSettings>().to(dbSettings_),
            di::bind<settings::LedgerSettings>().to(ledgerSettings_),

            di::bind<ports::output::IEventBus>()
                .to<adapters::secondary::InMemoryEventBus>()
                .in(di::singleton),

            di::bind<ports::input::IChartOfAccountsService>()
                .to<application::ChartOfAccountsService>()
                .in(di::singleton),

            di::bind<ports::input::IAccountResolver>()
                .to<application::AccountResolver>()
                .in(di::singleton),

            di::bind<ports::input::IJournalEntryService>()
                .to<application::JournalEntryService>()
                .in(di::singleton),

            di::bind<ports::input::IInvoicePostingService>()
                .to<application::InvoicePostingService>()
                .in(di::singleton),

            di::bind<ports::input::ILedgerQueryService>()
                .to<application::LedgerQueryService>()
                .in(di::singleton),

            di::bind<ports::input::IChartImportService>()
                .to<application::ChartImportService>()
                .in(di::singleton));
    };

    // ========================================================================
    // Layer 1: Secondary Adapters (Output Ports implementations)
    // ========================================================================

    if (ledgerSettings_->useInMemoryStorage()) {
        auto injector = di::make_injector(
            services(),

            di::bind<adapters::secondary::InMemoryLedgerStore>().in(di::singleton),

            di::bind<ports::output::IAccountGroupRepository>()
                .to<adapters::secondary::InMemoryAccountGroupRepository>()
                .in(di::singleton),

            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::InMemoryAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::IJournalRepository>()
                .to<adapters::secondary::InMemoryJournalRepository>()
                .in(di::singleton));

        resolveServices(injector);
        std::cout << "  ✓ Secondary Adapters: in-memory store (3 bindings)" << std::endl;
    } else {
        auto injector = di::make_injector(
            services(),

            di::bind<ports::output::IAccountGroupRepository>()
                .to<adapters::secondary::PostgresAccountGroupRepository>()
                .in(di::singleton),

            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::PostgresAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::IJournalRepository>()
                .to<adapters::secondary::PostgresJournalRepository>()
                .in(di::singleton));

        resolveServices(injector);
        std::cout << "  ✓ Secondary Adapters: PostgreSQL "
                  << dbSettings_->getHost() << ":" << dbSettings_->getPort()
                  << "/" << dbSettings_->getName() << " (3 bindings)" << std::endl;
    }

    std::cout << "  ✓ Application Services (6 bindings)" << std::endl;
    std::cout << "[LedgerApp] DI configuration completed" << std::endl;
}

int LedgerApp::execute()
{
    const std::string& command = args_[0];

    try {
        auto intArg = [this](size_t index) {
            if (args_.size() <= index) {
                throw std::invalid_argument("missing argument #" + std::to_string(index));
            }
            return std::stoll(args_[index]);
        };

        if (command == "seed") {
            return cmdSeed(intArg(1));
        }
        if (command == "import") {
            if (args_.size() < 3) throw std::invalid_argument("import requires <tenant> <csv>");
            return cmdImport(intArg(1), args_[2]);
        }
        if (command == "accounts") {
            return cmdAccounts(intArg(1));
        }
        if (command == "ledger") {
            int page = args_.size() > 3 ? std::stoi(args_[3]) : 1;
            int pageSize = args_.size() > 4 ? std::stoi(args_[4]) : 0;
            return cmdLedger(intArg(1), intArg(2), page, pageSize);
        }
        if (command == "trial-balance") {
            return cmdTrialBalance(intArg(1));
        }
        if (command == "demo") {
            return cmdDemo(intArg(1));
        }

        std::cerr << "[LedgerApp] Unknown command: " << command << std::endl;
        printUsage();
        return 2;
    } catch (const domain::LedgerError& e) {
        std::cerr << "[LedgerApp] " << command << " failed: " << e.what() << std::endl;
        std::cout << adapters::primary::LedgerJson::errorToJson("ledger_error", e).dump(2) << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[LedgerApp] Invalid arguments: " << e.what() << std::endl;
        printUsage();
        return 2;
    }
}

// ============================================================================
// Commands
// ============================================================================

int LedgerApp::cmdSeed(int64_t tenantId)
{
    auto summary = chartService_->seedStandardChart(tenantId);

    nlohmann::json result;
    result["tenant_id"] = tenantId;
    result["groups_created"] = summary.groupsCreated;
    result["accounts_created"] = summary.accountsCreated;
    std::cout << result.dump(2) << std::endl;
    return 0;
}

int LedgerApp::cmdImport(int64_t tenantId, const std::string& path)
{
    std::ifstream input(path);
    if (!input) {
        throw std::invalid_argument("cannot open " + path);
    }

    auto parsed = adapters::primary::CsvChartReader::read(input);
    for (const auto& error : parsed.errors) {
        std::cerr << "[LedgerApp] " << path << ":" << error.lineNumber << ": " << error.message << std::endl;
    }

    auto report = importService_->importChart(tenantId, parsed.rows);

    auto result = adapters::primary::LedgerJson::importReportToJson(report);
    for (size_t i = 0; i < result["rows"].size() && i < parsed.lineNumbers.size(); ++i) {
        result["rows"][i]["line"] = parsed.lineNumbers[i];
    }

    nlohmann::json parseErrors = nlohmann::json::array();
    for (const auto& error : parsed.errors) {
        parseErrors.push_back({{"line", error.lineNumber}, {"message", error.message}});
    }
    result["parse_errors"] = parseErrors;

    std::cout << result.dump(2) << std::endl;
    return report.failed() == 0 && parsed.errors.empty() ? 0 : 1;
}

int LedgerApp::cmdAccounts(int64_t tenantId)
{
    auto accounts = queryService_->listAccounts(tenantId);
    std::cout << adapters::primary::LedgerJson::accountsToJson(accounts).dump(2) << std::endl;
    return 0;
}

int LedgerApp::cmdLedger(int64_t tenantId, int64_t accountId, int page, int pageSize)
{
    auto ledger = queryService_->getLedger(tenantId, accountId, page, pageSize);
    std::cout << adapters::primary::LedgerJson::ledgerToJson(ledger).dump(2) << std::endl;
    return 0;
}

int LedgerApp::cmdTrialBalance(int64_t tenantId)
{
    auto trialBalance = queryService_->getTrialBalance(tenantId);
    std::cout << adapters::primary::LedgerJson::trialBalanceToJson(trialBalance).dump(2) << std::endl;
    return 0;
}

/**
 * Сквозной сценарий: стандартный план, утверждение счёта-фактуры,
 * частичная оплата, оборотно-сальдовая ведомость.
 */
int LedgerApp::cmdDemo(int64_t tenantId)
{
    chartService_->seedStandardChart(tenantId);

    domain::Invoice invoice;
    invoice.id = 1;
    invoice.tenantId = tenantId;
    invoice.invoiceNumber = "INV-0001";
    invoice.entityId = 101;
    invoice.entityName = "Acme Ltd";
    invoice.status = domain::InvoiceStatus::DRAFT;
    invoice.issueDate = domain::Timestamp::now();
    invoice.subtotal = domain::Money::fromUnits(1000);
    invoice.taxAmount = domain::Money::fromUnits(150);
    invoice.totalAmount = domain::Money::fromUnits(1150);

    auto approval = postingService_->onInvoiceApproved(invoice, std::nullopt);
    invoice.status = domain::InvoiceStatus::APPROVED;

    domain::Payment payment;
    payment.id = 1;
    payment.tenantId = tenantId;
    payment.invoiceId = invoice.id;
    payment.paymentDate = domain::Timestamp::now();
    payment.amount = domain::Money::fromUnits(500);
    payment.method = domain::PaymentMethod::BANK_TRANSFER;

    auto receipt = postingService_->onPaymentRecorded(invoice, payment);

    nlohmann::json result;
    result["approval_entry_id"] = approval.id;
    result["payment_entry_id"] = receipt.id;
    result["trial_balance"] = adapters::primary::LedgerJson::trialBalanceToJson(
        queryService_->getTrialBalance(tenantId));
    std::cout << result.dump(2) << std::endl;
    return 0;
}

void LedgerApp::printUsage() const
{
    std::cerr << "Usage: ledger-admin <command> [args]" << std::endl;
    std::cerr << "  seed <tenant>                          create the standard chart of accounts" << std::endl;
    std::cerr << "  import <tenant> <file.csv>             bulk import accounts" << std::endl;
    std::cerr << "  accounts <tenant>                      list accounts" << std::endl;
    std::cerr << "  ledger <tenant> <account> [page] [size] account ledger with running balance" << std::endl;
    std::cerr << "  trial-balance <tenant>                 balances of all accounts" << std::endl;
    std::cerr << "  demo <tenant>                          post a sample invoice and payment" << std::endl;
}

void LedgerApp::printStartupBanner() const
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║            Ledger Admin - Accounting Core            ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Storage:      PostgreSQL (libpqxx) / in-memory      ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
