#include "LedgerApp.hpp"

#include <boost/di.hpp>

// Application
#include "application/TransferOrchestrator.hpp"
#include "application/WalletStore.hpp"
#include "application/BalanceAdjuster.hpp"
#include "application/TransactionLog.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresLedgerRepository.hpp"
#include "adapters/secondary/InMemoryLedgerRepository.hpp"

#include <iostream>

namespace di = boost::di;

namespace ledger {

LedgerApp::LedgerApp() {
    std::clog << "[LedgerApp] Application created" << std::endl;
}

LedgerApp::~LedgerApp() = default;

int LedgerApp::run(int argc, char* argv[]) {
    loadEnvironment();
    configureInjection();
    return execute(std::vector<std::string>(argv + 1, argv + argc));
}

void LedgerApp::loadEnvironment() {
    std::clog << "[LedgerApp] Loading environment..." << std::endl;
    dbSettings_ = std::make_shared<settings::DbSettings>();
    ledgerSettings_ = std::make_shared<settings::LedgerSettings>();
    std::clog << "[LedgerApp] Environment loaded, lock timeout "
              << ledgerSettings_->getLockTimeout().count() << "ms, delivery fee "
              << ledgerSettings_->getDeliveryFee().toString() << std::endl;
}

std::shared_ptr<ports::output::ILedgerRepository> LedgerApp::createRepository() {
    if (ledgerSettings_->getStorage() == settings::LedgerSettings::Storage::MEMORY) {
        std::clog << "[LedgerApp] Storage: in-memory" << std::endl;
        return std::make_shared<adapters::secondary::InMemoryLedgerRepository>(
            ledgerSettings_->getLockTimeout());
    }

    std::clog << "[LedgerApp] Storage: PostgreSQL" << std::endl;
    return std::make_shared<adapters::secondary::PostgresLedgerRepository>(dbSettings_, ledgerSettings_);
}

void LedgerApp::configureInjection() {
    std::clog << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

    auto repository = createRepository();

    auto injector = di::make_injector(

        // ================================================================
        // Layer 1: Settings & Infrastructure
        // ================================================================
        di::bind<settings::DbSettings>().to(dbSettings_),
        di::bind<settings::LedgerSettings>().to(ledgerSettings_),

        // ================================================================
        // Layer 2: Secondary Adapters (Output Ports implementations)
        // ================================================================
        di::bind<ports::output::ILedgerRepository>().to(repository),

        // ================================================================
        // Layer 3: Application Services (Input Ports implementations)
        // ================================================================
        di::bind<application::WalletStore>().in(di::singleton),
        di::bind<application::BalanceAdjuster>().in(di::singleton),
        di::bind<application::TransactionLog>().in(di::singleton),

        di::bind<ports::input::IWalletLedgerService>()
            .to<application::TransferOrchestrator>()
            .in(di::singleton)
    );

    // ====================================================================
    // Layer 4: Primary Adapters
    // ====================================================================
    commandHandler_ = injector.create<std::shared_ptr<adapters::primary::LedgerCommandHandler>>();

    std::clog << "[LedgerApp] Configuration complete" << std::endl;
}

int LedgerApp::execute(const std::vector<std::string>& args) {
    auto result = commandHandler_->handle(args);
    // stdout: только JSON результата, журнал идёт в std::clog
    std::cout << result.body.dump(2) << std::endl;
    return result.exitCode;
}

} // namespace ledger
