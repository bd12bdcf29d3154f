// include/application/VaultCommandHandler.hpp
#pragma once

#include "ports/input/IVaultService.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IClock.hpp"
#include "domain/CallContext.hpp"
#include "domain/TreasuryError.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

namespace treasury::application {

/**
 * @brief Обработчик пользовательских команд хранилища
 *
 * Слушает команды из treasury.events exchange:
 * - vault.deposit  {caller, receiver, assets}
 * - vault.mint     {caller, receiver, shares}
 * - vault.withdraw {caller, receiver, owner, assets}
 * - vault.redeem   {caller, receiver, owner, shares}
 * - vault.transfer {caller, to, shares}
 *
 * Публикует результат:
 * - vault.command.completed → операция выполнена, с итоговыми суммами
 * - vault.command.rejected → код и категория ошибки
 *
 * receiver и owner по умолчанию равны caller.
 *
 * Граница доверия: caller берётся из тела команды как есть. Команды должен
 * публиковать только шлюз внешнего контроля доступа, который аутентифицировал
 * пользователя и проставил caller; прямой доступ клиентов к exchange не
 * допускается. Обработчик выдаёт только роль USER, поэтому поддельный caller
 * не открывает административных операций, а счета хранилища и стратегии
 * отклоняются самим Vault (Unauthorized).
 */
class VaultCommandHandler {
public:
    VaultCommandHandler(
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<ports::input::IVaultService> vault,
        std::shared_ptr<ports::output::IClock> clock
    ) : eventConsumer_(std::move(eventConsumer))
      , eventPublisher_(std::move(eventPublisher))
      , vault_(std::move(vault))
      , clock_(std::move(clock))
    {
        std::cout << "[VaultCommandHandler] Created" << std::endl;
        subscribe();
    }

private:
    void subscribe() {
        std::cout << "[VaultCommandHandler] Subscribing to vault.deposit, vault.mint, "
                  << "vault.withdraw, vault.redeem, vault.transfer" << std::endl;

        eventConsumer_->subscribe(
            {"vault.deposit", "vault.mint", "vault.withdraw", "vault.redeem", "vault.transfer"},
            [this](const std::string& routingKey, const std::string& message) {
                handleCommand(routingKey, message);
            }
        );
    }

    void handleCommand(const std::string& routingKey, const std::string& message) {
        std::cout << "[VaultCommandHandler] Received " << routingKey << std::endl;

        nlohmann::json json;
        try {
            json = nlohmann::json::parse(message);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[VaultCommandHandler] Malformed command: " << e.what() << std::endl;
            publishRejected(routingKey, "", "", "MalformedCommand", "VALIDATION", e.what());
            return;
        }

        std::string requestId = json.value("request_id", "");
        std::string caller = json.value("caller", "");
        if (caller.empty()) {
            std::cerr << "[VaultCommandHandler] Rejected: missing caller" << std::endl;
            publishRejected(routingKey, requestId, "", "MalformedCommand", "VALIDATION",
                            "Missing required field: caller");
            return;
        }

        try {
            auto ctx = domain::CallContext::user(caller);
            std::string receiver = json.value("receiver", caller);
            std::string owner = json.value("owner", caller);
            domain::Amount assets = json.value("assets", domain::Amount{0});
            domain::Amount shares = json.value("shares", domain::Amount{0});

            nlohmann::json result;
            if (routingKey == "vault.deposit") {
                result["assets"] = assets;
                result["shares"] = vault_->deposit(ctx, assets, receiver);
                result["receiver"] = receiver;
            } else if (routingKey == "vault.mint") {
                result["shares"] = shares;
                result["assets"] = vault_->mint(ctx, shares, receiver);
                result["receiver"] = receiver;
            } else if (routingKey == "vault.withdraw") {
                result["assets"] = assets;
                result["shares"] = vault_->withdraw(ctx, assets, receiver, owner);
                result["receiver"] = receiver;
                result["owner"] = owner;
            } else if (routingKey == "vault.redeem") {
                result["shares"] = shares;
                result["assets"] = vault_->redeem(ctx, shares, receiver, owner);
                result["receiver"] = receiver;
                result["owner"] = owner;
            } else if (routingKey == "vault.transfer") {
                std::string to = json.value("to", "");
                vault_->transfer(ctx, to, shares);
                result["to"] = to;
                result["shares"] = shares;
            } else {
                publishRejected(routingKey, requestId, caller, "UnknownCommand", "VALIDATION",
                                "Unsupported routing key");
                return;
            }

            publishCompleted(routingKey, requestId, caller, result);
        } catch (const domain::TreasuryError& e) {
            std::cerr << "[VaultCommandHandler] " << routingKey << " failed: " << e.what() << std::endl;
            publishRejected(routingKey, requestId, caller, domain::toString(e.code()),
                            domain::toString(e.category()), e.what());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[VaultCommandHandler] Bad field in " << routingKey << ": " << e.what() << std::endl;
            publishRejected(routingKey, requestId, caller, "MalformedCommand", "VALIDATION", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[VaultCommandHandler] Error: " << e.what() << std::endl;
            publishRejected(routingKey, requestId, caller, "InternalError", "EXECUTION", e.what());
        }
    }

    void publishCompleted(const std::string& command, const std::string& requestId,
                          const std::string& caller, const nlohmann::json& result) {
        std::cout << "[VaultCommandHandler] COMPLETED " << command
                  << " caller=" << caller << " result=" << result.dump() << std::endl;

        nlohmann::json event;
        event["request_id"] = requestId;
        event["command"] = command;
        event["caller"] = caller;
        event["status"] = "COMPLETED";
        event["result"] = result;
        event["timestamp"] = clock_->now();
        eventPublisher_->publish("vault.command.completed", event.dump());
    }

    void publishRejected(const std::string& command, const std::string& requestId,
                         const std::string& caller, const std::string& code,
                         const std::string& category, const std::string& reason) {
        std::cout << "[VaultCommandHandler] REJECTED " << command
                  << " caller=" << caller << " code=" << code << std::endl;

        nlohmann::json event;
        event["request_id"] = requestId;
        event["command"] = command;
        event["caller"] = caller;
        event["status"] = "REJECTED";
        event["code"] = code;
        event["category"] = category;
        event["reason"] = reason;
        event["timestamp"] = clock_->now();
        eventPublisher_->publish("vault.command.rejected", event.dump());
    }

    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<ports::input::IVaultService> vault_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace treasury::application
