// include/adapters/primary/LedgerCommandHandler.hpp
#pragma once

#include "ports/input/IWalletLedgerService.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/References.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include <iostream>

namespace ledger::adapters::primary {

/**
 * @brief Результат выполнения команды
 */
struct CommandResult {
    int exitCode = 0;
    nlohmann::json body;
};

/**
 * @brief Командный интерфейс к движку кошельков
 *
 * Команды:
 *   deposit <user> <amount> [reference]
 *   withdraw <user> <amount> [reference]
 *   debit-order <customer> <amount> <order-id>
 *   credit-owner <owner> <amount> <order-id>
 *   transfer-fee <owner> <agent> <delivery-id> [fee]
 *   balance <user>
 *   transactions <user>
 *   audit <user>
 *
 * Коды выхода:
 *   0 успех
 *   2 неверный запрос
 *   3 недостаточно средств
 *   4 хранилище недоступно
 *   5 нарушение инварианта
 */
class LedgerCommandHandler {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_INVALID = 2;
    static constexpr int EXIT_INSUFFICIENT_FUNDS = 3;
    static constexpr int EXIT_STORAGE_UNAVAILABLE = 4;
    static constexpr int EXIT_INVARIANT_VIOLATION = 5;

    LedgerCommandHandler(
        std::shared_ptr<ports::input::IWalletLedgerService> ledgerService,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : ledgerService_(std::move(ledgerService))
      , settings_(std::move(settings))
    {}

    CommandResult handle(const std::vector<std::string>& args) {
        if (args.empty()) {
            return usage("No command given");
        }

        try {
            return dispatch(args[0], std::vector<std::string>(args.begin() + 1, args.end()));

        } catch (const domain::InsufficientFundsException& e) {
            nlohmann::json body = error("insufficient_funds", e.what());
            body["wallet_id"] = e.walletId();
            body["available"] = e.available().toString();
            body["requested"] = e.requested().toString();
            return {EXIT_INSUFFICIENT_FUNDS, body};

        } catch (const domain::StorageUnavailableException& e) {
            nlohmann::json body = error("storage_unavailable", e.what());
            body["retryable"] = e.retryable();
            return {EXIT_STORAGE_UNAVAILABLE, body};

        } catch (const domain::InvariantViolationException& e) {
            return {EXIT_INVARIANT_VIOLATION, error("invariant_violation", e.what())};

        } catch (const domain::InvalidRequestException& e) {
            return {EXIT_INVALID, error("invalid_request", e.what())};

        } catch (const std::invalid_argument& e) {
            // Money::fromString
            return {EXIT_INVALID, error("invalid_request", e.what())};

        } catch (const std::overflow_error& e) {
            // Сумма вне диапазона NUMERIC(12,2)
            return {EXIT_INVALID, error("invalid_request", e.what())};
        }
    }

private:
    std::shared_ptr<ports::input::IWalletLedgerService> ledgerService_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    CommandResult dispatch(const std::string& command, const std::vector<std::string>& params) {
        if (command == "deposit" && (params.size() == 2 || params.size() == 3)) {
            auto amount = domain::Money::fromString(params[1]);
            auto reference = params.size() == 3 ? params[2] : std::string("Added to Wallet");
            auto balance = ledgerService_->deposit(params[0], amount, reference);
            return ok(balanceBody(params[0], balance));
        }

        if (command == "withdraw" && (params.size() == 2 || params.size() == 3)) {
            auto amount = domain::Money::fromString(params[1]);
            auto reference = params.size() == 3 ? params[2] : std::string("Withdrawn to Bank");
            auto balance = ledgerService_->withdraw(params[0], amount, reference);
            return ok(balanceBody(params[0], balance));
        }

        if (command == "debit-order" && params.size() == 3) {
            auto amount = domain::Money::fromString(params[1]);
            auto balance = ledgerService_->debitForOrder(
                params[0], amount, domain::references::order(params[2]));
            return ok(balanceBody(params[0], balance));
        }

        if (command == "credit-owner" && params.size() == 3) {
            auto amount = domain::Money::fromString(params[1]);
            auto balance = ledgerService_->creditOwnerForOrder(
                params[0], amount, domain::references::order(params[2]));
            return ok(balanceBody(params[0], balance));
        }

        if (command == "transfer-fee" && (params.size() == 3 || params.size() == 4)) {
            auto fee = params.size() == 4
                ? domain::Money::fromString(params[3])
                : settings_->getDeliveryFee();
            auto result = ledgerService_->transferDeliveryFee(
                params[0], params[1], fee, domain::references::delivery(params[2]));

            nlohmann::json body;
            body["owner"] = balanceBody(params[0], result.ownerBalance);
            body["agent"] = balanceBody(params[1], result.agentBalance);
            body["fee"] = fee.toString();
            return ok(body);
        }

        if (command == "balance" && params.size() == 1) {
            return ok(balanceBody(params[0], ledgerService_->getBalance(params[0])));
        }

        if (command == "transactions" && params.size() == 1) {
            nlohmann::json items = nlohmann::json::array();
            for (const auto& record : ledgerService_->listTransactions(params[0])) {
                items.push_back({
                    {"id", record.transactionId},
                    {"txn_type", domain::toString(record.type)},
                    {"amount", record.amount.toString()},
                    {"reference", record.reference},
                    {"created_at", record.createdAt.toString()}
                });
            }
            nlohmann::json body;
            body["user"] = params[0];
            body["transactions"] = items;
            return ok(body);
        }

        if (command == "audit" && params.size() == 1) {
            auto report = ledgerService_->auditWallet(params[0]);
            nlohmann::json body;
            body["user"] = report.userId;
            body["wallet_id"] = report.walletId;
            body["balance"] = report.balance.toString();
            body["ledger_total"] = report.ledgerTotal.toString();
            body["records"] = report.recordCount;
            body["consistent"] = report.consistent();
            return {report.consistent() ? EXIT_OK : EXIT_INVARIANT_VIOLATION, body};
        }

        return usage("Unknown command or wrong arguments: " + command);
    }

    static nlohmann::json balanceBody(const std::string& userId, const domain::Money& balance) {
        nlohmann::json body;
        body["user"] = userId;
        body["balance"] = balance.toString();
        return body;
    }

    static nlohmann::json error(const std::string& code, const std::string& message) {
        nlohmann::json body;
        body["error"] = code;
        body["message"] = message;
        return body;
    }

    static CommandResult ok(const nlohmann::json& body) {
        return {EXIT_OK, body};
    }

    static CommandResult usage(const std::string& message) {
        std::cerr << "[LedgerCommandHandler] " << message << std::endl;
        return {EXIT_INVALID, error("usage", message)};
    }
};

} // namespace ledger::adapters::primary
