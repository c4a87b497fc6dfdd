#pragma once

#include "ports/input/IStockService.hpp"
#include "ports/output/IMovementStore.hpp"
#include "ports/output/IAuditSink.hpp"
#include "ports/output/ILotRegistry.hpp"
#include "settings/ILedgerSettings.hpp"
#include "application/BalanceCalculator.hpp"
#include "application/AuditRecords.hpp"
#include "application/PublishGate.hpp"
#include "domain/Errors.hpp"
#include "utils/UuidGenerator.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <mutex>
#include <map>
#include <algorithm>
#include <functional>
#include <limits>
#include <iostream>

namespace ledger::application {

/**
 * @brief Состояние ключа (держатель, партия) в критической секции
 *
 * reserved - расход, уже прошедший проверку остатка, но ещё не записанный
 * в хранилище. incoming - такой же ещё не записанный приход. Оба меняются
 * только под mutex.
 */
struct StockKeyState {
    std::timed_mutex mutex;
    int64_t reserved = 0;
    int64_t incoming = 0;
};

/**
 * @brief Подготовленные движения с зарезервированным расходом
 *
 * commit() записывает все движения одной пачкой и снимает резерв.
 * Если commit() не вызван или завершился исключением, деструктор снимает
 * резерв, а хранилище остаётся нетронутым.
 */
class StockReservation {
public:
    struct Hold {
        domain::StockKey key;
        std::shared_ptr<StockKeyState> state;
        int64_t outbound = 0;
        int64_t inbound = 0;
    };

    /**
     * @brief Запись в другое хранилище, публикуемая вместе с движениями
     *
     * apply выполняется перед записью движений; revert откатывает её,
     * если движения записать не удалось.
     */
    struct LinkedWrite {
        std::function<void()> apply;
        std::function<void()> revert;
    };

    StockReservation(
        std::shared_ptr<ports::output::IMovementStore> store,
        std::shared_ptr<PublishGate> gate,
        std::vector<domain::Movement> movements,
        std::vector<Hold> holds)
        : store_(std::move(store))
        , gate_(std::move(gate))
        , movements_(std::move(movements))
        , holds_(std::move(holds))
    {}

    StockReservation(StockReservation&& other) noexcept
        : store_(std::move(other.store_))
        , gate_(std::move(other.gate_))
        , movements_(std::move(other.movements_))
        , holds_(std::move(other.holds_))
        , done_(other.done_)
    {
        other.holds_.clear();
        other.done_ = true;
    }

    StockReservation(const StockReservation&) = delete;
    StockReservation& operator=(const StockReservation&) = delete;
    StockReservation& operator=(StockReservation&&) = delete;

    ~StockReservation() {
        if (!done_) {
            release();
        }
    }

    const std::vector<domain::Movement>& movements() const { return movements_; }

    /**
     * @brief Записать движения (и связанную запись) и снять резерв
     *
     * Ключи блокируются без таймаута: их держат только короткие секции
     * проверки и записи. Публикация идёт под PublishGate::publish().
     */
    std::vector<std::string> commit(const LinkedWrite& linked = {}) {
        if (done_) {
            throw domain::ValidationError("Stock reservation is already settled");
        }

        std::vector<std::unique_lock<std::timed_mutex>> locks;
        locks.reserve(holds_.size());
        for (auto& hold : holds_) {
            locks.emplace_back(hold.state->mutex);
        }
        auto publishing = gate_->publish();

        if (linked.apply) {
            linked.apply();
        }
        std::vector<std::string> ids;
        try {
            ids = store_->appendAll(movements_);
        } catch (const std::exception& e) {
            std::cerr << "[StockReservation] Append failed: " << e.what() << std::endl;
            if (linked.apply && linked.revert) {
                linked.revert();
            }
            throw;
        }

        for (auto& hold : holds_) {
            hold.state->reserved -= hold.outbound;
            hold.state->incoming -= hold.inbound;
        }
        done_ = true;
        return ids;
    }

private:
    std::shared_ptr<ports::output::IMovementStore> store_;
    std::shared_ptr<PublishGate> gate_;
    std::vector<domain::Movement> movements_;
    std::vector<Hold> holds_;   // в каноничном порядке ключей
    bool done_ = false;

    void release() {
        for (auto& hold : holds_) {
            std::lock_guard<std::timed_mutex> lock(hold.state->mutex);
            hold.state->reserved -= hold.outbound;
            hold.state->incoming -= hold.inbound;
        }
        done_ = true;
    }
};

/**
 * @brief Сервис движений запасов
 *
 * Порядок любой записи:
 * 1. Валидация и проверка партии (вне блокировок)
 * 2. Критическая секция по ключам в каноничном порядке: остаток - резерв >= расход,
 *    затем резерв
 * 3. Аудит (вне блокировок); ошибка аудита снимает резерв
 * 4. Запись пачки в хранилище и снятие резерва
 */
class StockService : public ports::input::IStockService {
public:
    StockService(
        std::shared_ptr<ports::output::IMovementStore> store,
        std::shared_ptr<BalanceCalculator> calculator,
        std::shared_ptr<ports::output::IAuditSink> auditSink,
        std::shared_ptr<ports::output::ILotRegistry> lotRegistry,
        std::shared_ptr<settings::ILedgerSettings> settings,
        std::shared_ptr<PublishGate> gate
    ) : store_(std::move(store))
      , calculator_(std::move(calculator))
      , auditSink_(std::move(auditSink))
      , lotRegistry_(std::move(lotRegistry))
      , settings_(std::move(settings))
      , gate_(std::move(gate))
    {
        std::cout << "[StockService] Created" << std::endl;
    }

    domain::Movement recordMovement(const domain::MovementRequest& request) override {
        validateEntity(request.entity);
        validateLot(request.lotId);
        if (!domain::isKnown(request.kind)) {
            throw domain::ValidationError("Unknown movement kind");
        }
        if (request.quantity <= 0) {
            throw domain::ValidationError("Quantity must be positive");
        }
        ensureLotUsable(request.lotId, request.lotUsable);

        auto movement = makeMovement(
            domain::StockKey{request.entity, request.lotId},
            request.kind, request.quantity, request.reference, request.actorId);
        return commitWithAudit({movement}).front();
    }

    domain::Movement recordAdjustment(
        const domain::EntityRef& entity,
        const std::string& lotId,
        int64_t signedQuantity,
        const domain::Reference& reference,
        const std::string& actorId,
        std::optional<bool> lotUsable = std::nullopt) override
    {
        validateEntity(entity);
        validateLot(lotId);
        if (signedQuantity == 0) {
            throw domain::ValidationError("Adjustment quantity must be non-zero");
        }
        if (signedQuantity == std::numeric_limits<int64_t>::min()) {
            throw domain::ValidationError("Adjustment quantity out of range");
        }
        ensureLotUsable(lotId, lotUsable);

        auto movement = makeMovement(
            domain::StockKey{entity, lotId},
            domain::MovementKind::ADJUSTMENT, signedQuantity, reference, actorId);
        return commitWithAudit({movement}).front();
    }

    std::pair<domain::Movement, domain::Movement> processDualMovement(
        const domain::DualMovementRequest& request) override
    {
        auto movements = commitWithAudit(planDualMovement(request));
        return {movements[0], movements[1]};
    }

    domain::Movement processSingleSale(
        const domain::EntityRef& entity,
        const std::string& lotId,
        int64_t quantity,
        const domain::Reference& reference,
        const std::string& actorId,
        std::optional<bool> lotUsable = std::nullopt) override
    {
        domain::MovementRequest request;
        request.entity = entity;
        request.lotId = lotId;
        request.kind = domain::MovementKind::SALE;
        request.quantity = quantity;
        request.reference = reference;
        if (request.reference.kind.empty()) {
            request.reference.kind = "Sale";
        }
        request.actorId = actorId;
        request.lotUsable = lotUsable;
        return recordMovement(request);
    }

    int64_t getBalance(const domain::EntityRef& entity, const std::string& lotId) override {
        auto reading = gate_->read();
        return calculator_->computeBalance(entity, lotId);
    }

    std::vector<domain::Movement> getMovementHistory(
        const domain::EntityRef& entity,
        const std::string& lotId) override
    {
        auto reading = gate_->read();
        return store_->queryOrdered(domain::StockKey{entity, lotId});
    }

    std::vector<domain::Movement> getMovementsByReference(const std::string& referenceId) override {
        auto reading = gate_->read();
        return store_->findByReference(referenceId);
    }

    /**
     * @brief Проверить запрос и построить пару TRANSFER_OUT / TRANSFER_IN
     *
     * Ничего не пишет и не блокирует.
     */
    std::vector<domain::Movement> planDualMovement(const domain::DualMovementRequest& request) {
        validateEntity(request.seller);
        validateEntity(request.buyer);
        validateLot(request.lotId);
        if (request.seller == request.buyer) {
            throw domain::ValidationError("Seller and buyer must differ: " + request.seller.toString());
        }
        if (request.quantity <= 0) {
            throw domain::ValidationError("Quantity must be positive");
        }
        ensureLotUsable(request.lotId, request.lotUsable);

        auto reference = request.reference;
        if (reference.kind.empty()) {
            reference.kind = "Transfer";
        }
        return {
            makeMovement(domain::StockKey{request.seller, request.lotId},
                         domain::MovementKind::TRANSFER_OUT, request.quantity, reference, request.actorId),
            makeMovement(domain::StockKey{request.buyer, request.lotId},
                         domain::MovementKind::TRANSFER_IN, request.quantity, reference, request.actorId)
        };
    }

    /**
     * @brief Критическая секция: проверить остатки и зарезервировать расход
     *
     * При ConcurrencyConflict секция повторяется с нуля (с перечитыванием
     * остатка) не более getConflictRetries() раз.
     * @throws InsufficientStockError, ConcurrencyConflict
     */
    StockReservation prepareMovements(const std::vector<domain::Movement>& movements) {
        int attempts = 1 + std::max(0, settings_->getConflictRetries());
        for (int attempt = 1;; ++attempt) {
            try {
                return reserve(movements);
            } catch (const domain::ConcurrencyConflict& e) {
                if (attempt >= attempts) {
                    std::cerr << "[StockService] Conflict, giving up: " << e.what() << std::endl;
                    throw;
                }
                std::cerr << "[StockService] Conflict, retrying: " << e.what() << std::endl;
            }
        }
    }

private:
    std::shared_ptr<ports::output::IMovementStore> store_;
    std::shared_ptr<BalanceCalculator> calculator_;
    std::shared_ptr<ports::output::IAuditSink> auditSink_;
    std::shared_ptr<ports::output::ILotRegistry> lotRegistry_;
    std::shared_ptr<settings::ILedgerSettings> settings_;
    std::shared_ptr<PublishGate> gate_;
    ThreadSafeMap<domain::StockKey, StockKeyState> keyStates_;

    StockReservation reserve(const std::vector<domain::Movement>& movements) {
        // std::map даёт каноничный порядок: вид держателя, id, партия
        std::map<domain::StockKey, std::pair<int64_t, int64_t>> flows;   // расход, приход
        for (const auto& m : movements) {
            int64_t delta = m.signedQuantity();
            auto& flow = flows[m.key()];
            int64_t& total = delta < 0 ? flow.first : flow.second;
            if (__builtin_add_overflow(total, delta < 0 ? -delta : delta, &total)) {
                throw domain::ValidationError("Movement quantity out of range for " + m.key().toString());
            }
        }

        std::vector<StockReservation::Hold> holds;
        std::vector<std::unique_lock<std::timed_mutex>> locks;
        for (const auto& [key, flow] : flows) {
            auto state = keyStates_.getOrCreate(key);
            std::unique_lock<std::timed_mutex> lock(state->mutex, std::defer_lock);
            if (!lock.try_lock_for(settings_->getLockTimeout())) {
                throw domain::ConcurrencyConflict("Timed out entering critical section for " + key.toString());
            }
            locks.push_back(std::move(lock));
            holds.push_back({key, state, flow.first, flow.second});
        }

        for (const auto& hold : holds) {
            int64_t balance = calculator_->computeBalance(hold.key);
            if (hold.outbound > 0) {
                int64_t available = balance - hold.state->reserved;
                if (available < hold.outbound) {
                    std::cerr << "[StockService] REJECTED: " << hold.key.toString()
                              << " balance=" << available << " requested=" << hold.outbound << std::endl;
                    throw domain::InsufficientStockError(available, hold.outbound);
                }
            }
            if (hold.inbound > 0) {
                // Остаток с учётом ещё не записанных приходов обязан остаться в int64
                int64_t headroom = std::numeric_limits<int64_t>::max() - balance - hold.state->incoming;
                if (hold.inbound > headroom) {
                    std::cerr << "[StockService] REJECTED: " << hold.key.toString()
                              << " balance=" << balance << " incoming=" << hold.inbound
                              << " exceeds the representable range" << std::endl;
                    throw domain::ValidationError("Balance would overflow for " + hold.key.toString());
                }
            }
        }
        for (auto& hold : holds) {
            hold.state->reserved += hold.outbound;
            hold.state->incoming += hold.inbound;
        }

        return StockReservation(store_, gate_, movements, std::move(holds));
    }

    std::vector<domain::Movement> commitWithAudit(const std::vector<domain::Movement>& movements) {
        auto reservation = prepareMovements(movements);

        std::vector<domain::AuditRecord> records;
        for (const auto& m : movements) {
            records.push_back(audit::movementCreated(m));
        }
        try {
            auditSink_->recordAll(records);
        } catch (const std::exception& e) {
            std::cerr << "[StockService] Audit failed, movement discarded: " << e.what() << std::endl;
            throw;
        }

        reservation.commit();
        for (const auto& m : movements) {
            std::cout << "[StockService] " << domain::toString(m.kind()) << " " << m.id()
                      << " qty=" << m.quantity() << " key=" << m.key().toString() << std::endl;
        }
        return movements;
    }

    void ensureLotUsable(const std::string& lotId, std::optional<bool> lotUsable) {
        bool usable = false;
        if (lotUsable) {
            usable = *lotUsable;
        } else if (lotRegistry_) {
            usable = lotRegistry_->isLotUsable(lotId);
        } else {
            throw domain::ValidationError("Lot usability not supplied and no lot registry configured");
        }
        if (!usable) {
            std::cerr << "[StockService] REJECTED: lot " << lotId << " is not usable" << std::endl;
            throw domain::LotUnusableError(lotId);
        }
    }

    static void validateEntity(const domain::EntityRef& entity) {
        if (!domain::isKnown(entity.kind)) {
            throw domain::ValidationError("Unknown entity kind");
        }
        if (entity.id.empty()) {
            throw domain::ValidationError("Entity id is required");
        }
    }

    static void validateLot(const std::string& lotId) {
        if (lotId.empty()) {
            throw domain::ValidationError("Lot id is required");
        }
    }

    static domain::Movement makeMovement(
        domain::StockKey key,
        domain::MovementKind kind,
        int64_t quantity,
        const domain::Reference& reference,
        const std::string& actorId)
    {
        return domain::Movement(
            utils::UuidGenerator::generateWithPrefix("mov"),
            std::move(key), kind, quantity, reference, actorId,
            domain::Timestamp::now());
    }
};

} // namespace ledger::application
