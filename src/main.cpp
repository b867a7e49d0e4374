#include "LedgerApp.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        ledger::LedgerApp app;

        std::clog << "========================================" << std::endl;
        std::clog << "  Wallet Ledger v1.0.0" << std::endl;
        std::clog << "========================================" << std::endl;

        return app.run(argc, argv);

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
