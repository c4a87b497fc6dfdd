#include "LedgerApp.hpp"

#include "ports/input/IStockService.hpp"
#include "ports/input/IJournalService.hpp"
#include "ports/input/ILedgerCoordinator.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "adapters/secondary/InMemoryLotRegistry.hpp"
#include "adapters/secondary/InMemoryAccountResolver.hpp"
#include "domain/Errors.hpp"

#include <iostream>

using namespace ledger;

namespace
{
    /**
     * @brief Счета держателя: дебиторка, кредиторка, запасы, выручка
     */
    domain::AccountSet openAccounts(ports::output::IAccountRepository& repo,
                                    const domain::EntityRef& owner,
                                    const std::string& suffix)
    {
        domain::AccountSet set{
            "acc-1200-" + suffix, "acc-2100-" + suffix,
            "acc-1300-" + suffix, "acc-4000-" + suffix};
        repo.save({set.receivable, domain::AccountClass::ASSET, "1200-" + suffix, owner});
        repo.save({set.payable, domain::AccountClass::LIABILITY, "2100-" + suffix, owner});
        repo.save({set.inventory, domain::AccountClass::ASSET, "1300-" + suffix, owner});
        repo.save({set.revenue, domain::AccountClass::REVENUE, "4000-" + suffix, owner});
        return set;
    }
}

int main()
{
    try
    {
        std::cout << "========================================" << std::endl;
        std::cout << "  Pharmacy Ledger Core Demo" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << std::endl;

        LedgerApp app;

        const domain::EntityRef wholesaler{domain::EntityKind::WHOLESALE_PHARMACY, "W-001"};
        const domain::EntityRef pharmacy{domain::EntityKind::RETAIL_PHARMACY, "P-001"};
        const std::string lot = "LOT-AMOX-2026-01";

        app.lotRegistry()->setUsable(lot, true);
        app.accountResolver()->assign(
            wholesaler, openAccounts(*app.accountRepository(), wholesaler, "W001"));
        auto pharmacyAccounts = openAccounts(*app.accountRepository(), pharmacy, "P001");
        app.accountResolver()->assign(pharmacy, pharmacyAccounts);

        // Импорт на склад оптовика
        domain::MovementRequest import;
        import.entity = wholesaler;
        import.lotId = lot;
        import.kind = domain::MovementKind::IMPORT;
        import.quantity = 100;
        import.reference = {"IMP-2026-0001", "ImportPermit"};
        import.actorId = "demo";
        app.stockService()->recordMovement(import);

        // Поставка в аптеку
        domain::TransferRequest transfer;
        transfer.seller = wholesaler;
        transfer.buyer = pharmacy;
        transfer.lotId = lot;
        transfer.quantity = 40;
        transfer.unitValue = domain::Money::fromString("1250.50");
        transfer.reference = {"ORD-2026-0001", "Order"};
        transfer.actorId = "demo";
        auto result = app.coordinator()->executeTransfer(transfer);

        // Розничная продажа
        app.stockService()->processSingleSale(pharmacy, lot, 3, {"RCPT-0001", ""}, "demo");

        // Продажа сверх остатка отклоняется
        try
        {
            app.stockService()->processSingleSale(pharmacy, lot, 1000, {"RCPT-0002", ""}, "demo");
        }
        catch (const domain::InsufficientStockError &e)
        {
            std::cout << "[main] Expected rejection: " << e.what() << std::endl;
        }

        auto trial = app.journalService()->getTrialBalance();

        std::cout << std::endl;
        std::cout << "  Transfer entry:    " << result.journalEntryId << std::endl;
        std::cout << "  Wholesaler stock:  " << app.stockService()->getBalance(wholesaler, lot) << std::endl;
        std::cout << "  Pharmacy stock:    " << app.stockService()->getBalance(pharmacy, lot) << std::endl;
        std::cout << "  Pharmacy inventory: "
                  << app.journalService()->getAccountBalance(pharmacyAccounts.inventory).toString()
                  << std::endl;
        std::cout << "  Trial balance:     " << trial.debitTotal.toString() << " / "
                  << trial.creditTotal.toString()
                  << (trial.isBalanced() ? " (balanced)" : " (NOT balanced)") << std::endl;
        std::cout << std::endl;

        return 0;
    }
    catch (const ledger::domain::LedgerError &e)
    {
        std::cerr << "[main] Ledger error " << e.code() << ": " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
