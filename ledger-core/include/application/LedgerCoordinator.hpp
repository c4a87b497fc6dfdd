#pragma once

#include "ports/input/ILedgerCoordinator.hpp"
#include "ports/output/IAccountResolver.hpp"
#include "ports/output/IAuditSink.hpp"
#include "application/StockService.hpp"
#include "application/JournalService.hpp"
#include "application/AuditRecords.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Координатор поставки: движения товара и проводка одной единицей работы
 *
 * Порядок executeTransfer():
 * 1. Валидация и план движений (без блокировок)
 * 2. Разрешение счетов продавца и покупателя (внешний вызов, без блокировок)
 * 3. Сборка и проверка проведённой записи
 * 4. Резерв остатка продавца (короткая критическая секция)
 * 5. Аудит всей единицы одной пачкой
 * 6. Публикация под ключами продавца и покупателя: сначала запись
 *    журнала, затем движения; если движения не записались, запись
 *    журнала убирается до конца публикации
 *
 * Любая ошибка оставляет хранилища нетронутыми: резерв снимается
 * деструктором StockReservation. Читатели видят поставку целиком
 * или не видят её (PublishGate).
 */
class LedgerCoordinator : public ports::input::ILedgerCoordinator {
public:
    LedgerCoordinator(
        std::shared_ptr<StockService> stock,
        std::shared_ptr<JournalService> journal,
        std::shared_ptr<ports::output::IAccountResolver> resolver,
        std::shared_ptr<ports::output::IAuditSink> auditSink
    ) : stock_(std::move(stock))
      , journal_(std::move(journal))
      , resolver_(std::move(resolver))
      , auditSink_(std::move(auditSink))
    {
        std::cout << "[LedgerCoordinator] Created" << std::endl;
    }

    domain::TransferResult executeTransfer(const domain::TransferRequest& request) override {
        if (!request.unitValue.isPositive()) {
            throw domain::ValidationError("Unit value must be positive");
        }

        domain::DualMovementRequest dual;
        dual.seller = request.seller;
        dual.buyer = request.buyer;
        dual.lotId = request.lotId;
        dual.quantity = request.quantity;
        dual.reference = request.reference;
        dual.actorId = request.actorId;
        dual.lotUsable = request.lotUsable;
        auto movements = stock_->planDualMovement(dual);

        auto sellerAccounts = resolveAccounts(request.seller);
        auto buyerAccounts = resolveAccounts(request.buyer);

        auto amount = request.unitValue * request.quantity;
        domain::JournalEntryRequest entryRequest;
        entryRequest.date = request.date.empty()
            ? domain::Timestamp::now().toDateString()
            : request.date;
        entryRequest.reference = request.reference.id;
        entryRequest.description = "Transfer of " + std::to_string(request.quantity)
            + " x lot " + request.lotId + " from " + request.seller.toString()
            + " to " + request.buyer.toString();
        entryRequest.createdBy = request.actorId;
        entryRequest.lines = {
            domain::JournalLine::debitLine(buyerAccounts.inventory, amount),
            domain::JournalLine::creditLine(sellerAccounts.revenue, amount)
        };
        auto entry = journal_->preparePostedEntry(entryRequest, request.actorId);

        auto reservation = stock_->prepareMovements(movements);

        try {
            auditSink_->recordAll({
                audit::movementCreated(movements[0]),
                audit::movementCreated(movements[1]),
                audit::entryCreated(entry),
                audit::entryPosted(entry)
            });
        } catch (const std::exception& e) {
            std::cerr << "[LedgerCoordinator] Audit failed, transfer rolled back: " << e.what() << std::endl;
            throw;
        }

        // Запись журнала и движения публикуются под одной блокировкой ключей
        reservation.commit({
            [&]() { journal_->commitPostedEntry(entry); },
            [&]() { journal_->retractPostedEntry(entry.id); }
        });

        std::cout << "[LedgerCoordinator] Transfer " << request.seller.toString()
                  << " -> " << request.buyer.toString()
                  << " lot=" << request.lotId << " qty=" << request.quantity
                  << " amount=" << amount.toString() << " " << amount.currency
                  << " entry=" << entry.id << std::endl;

        return domain::TransferResult{movements[0].id(), movements[1].id(), entry.id};
    }

private:
    std::shared_ptr<StockService> stock_;
    std::shared_ptr<JournalService> journal_;
    std::shared_ptr<ports::output::IAccountResolver> resolver_;
    std::shared_ptr<ports::output::IAuditSink> auditSink_;

    domain::AccountSet resolveAccounts(const domain::EntityRef& entity) {
        std::optional<domain::AccountSet> accounts;
        try {
            accounts = resolver_->accountsFor(entity);
        } catch (const std::exception& e) {
            std::cerr << "[LedgerCoordinator] Account resolution failed for "
                      << entity.toString() << ": " << e.what() << std::endl;
            throw;
        }
        if (!accounts) {
            std::cerr << "[LedgerCoordinator] No accounts for " << entity.toString() << std::endl;
            throw domain::ResourceNotFoundError("No accounts configured for " + entity.toString());
        }
        return *accounts;
    }
};

} // namespace ledger::application
