// include/LedgerApp.hpp
#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "adapters/primary/LedgerCommandHandler.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ledger {

/**
 * @brief Wallet Ledger Application
 *
 * Точка входа движка кошельков.
 * Настраивает Boost.DI контейнер и выполняет одну команду.
 *
 * Template Method:
 * 1. loadEnvironment(): настройки из ENV
 * 2. configureInjection(): граф объектов
 * 3. execute(): команда из argv, JSON в stdout
 */
class LedgerApp {
public:
    LedgerApp();
    ~LedgerApp();

    /**
     * @return Код выхода процесса
     */
    int run(int argc, char* argv[]);

protected:
    void loadEnvironment();
    void configureInjection();
    int execute(const std::vector<std::string>& args);

private:
    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::LedgerSettings> ledgerSettings_;
    std::shared_ptr<adapters::primary::LedgerCommandHandler> commandHandler_;

    std::shared_ptr<ports::output::ILedgerRepository> createRepository();
};

} // namespace ledger
