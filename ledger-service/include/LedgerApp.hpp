// include/LedgerApp.hpp
#pragma once

#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/SchedulerSettings.hpp"

// Ports
#include "ports/input/ILedger.hpp"
#include "ports/input/IAssetRegistry.hpp"
#include "ports/input/IAccountDirectory.hpp"
#include "ports/input/ITransactionFactory.hpp"
#include "ports/input/IBankService.hpp"
#include "ports/input/IAutoRewardService.hpp"
#include "ports/input/IRoleShopService.hpp"
#include "ports/input/IMonthlyAllowanceService.hpp"
#include "ports/input/IVcEarningService.hpp"
#include "ports/input/IBettingService.hpp"
#include "ports/output/IStorage.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IMemberDirectory.hpp"
#include "ports/output/IClock.hpp"

// Application
#include "application/LedgerService.hpp"
#include "application/AssetRegistry.hpp"
#include "application/AccountDirectory.hpp"
#include "application/TransactionFactory.hpp"
#include "application/BankService.hpp"
#include "application/AutoRewardService.hpp"
#include "application/RoleShopService.hpp"
#include "application/MonthlyAllowanceService.hpp"
#include "application/VcEarningService.hpp"
#include "application/BettingService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/PostgresStorage.hpp"
#include "adapters/secondary/events/LogEventPublisher.hpp"
#include "adapters/secondary/EventingMemberDirectory.hpp"
#include "adapters/secondary/SystemClock.hpp"

// Primary Adapters
#include "adapters/primary/ActionDispatcher.hpp"
#include "adapters/primary/ScheduledJobs.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>

namespace di = boost::di;

namespace ledger {

/**
 * @brief Guild Ledger daemon
 *
 * Поднимает ядро и подсистемы поверх PostgreSQL, запускает фоновые обходы
 * и ждёт сигнала остановки. События уходят строками JSON в stdout.
 */
class LedgerApp {
public:
    LedgerApp() { std::cout << "[LedgerApp] Initializing..." << std::endl; }
    ~LedgerApp() { std::cout << "[LedgerApp] Shutting down..." << std::endl; }

    LedgerApp(const LedgerApp&) = delete;
    LedgerApp& operator=(const LedgerApp&) = delete;

    /**
     * @brief Template Method: loadEnvironment -> configureInjection -> ожидание stop()
     */
    void run(int argc, char* argv[]) {
        loadEnvironment(argc, argv);
        configureInjection();

        jobs_->start();
        std::cout << "[LedgerApp] Running" << std::endl;

        // stop() приходит из обработчика сигнала без мьютекса, поэтому ждём с таймаутом
        std::unique_lock<std::mutex> lock(mutex_);
        while (!cv_.wait_for(lock, std::chrono::milliseconds(500),
                             [this] { return stopRequested_.load(); })) {
        }

        jobs_->stop();
        std::cout << "[LedgerApp] Stopped" << std::endl;
    }

    /// Можно вызывать из обработчика сигнала
    void stop() {
        stopRequested_ = true;
        cv_.notify_all();
    }

    std::shared_ptr<adapters::primary::ActionDispatcher> dispatcher() const { return dispatcher_; }

protected:
    void loadEnvironment(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::cout << "[LedgerApp] Ignoring argument: " << argv[i] << std::endl;
        }
        std::cout << "[LedgerApp] Environment loaded" << std::endl;
    }

    void configureInjection() {
        std::cout << "[LedgerApp] Configuring DI..." << std::endl;

        auto injector = di::make_injector(
            di::bind<settings::DbSettings>().in(di::singleton),
            di::bind<settings::LedgerSettings>().in(di::singleton),
            di::bind<settings::SchedulerSettings>().in(di::singleton),

            di::bind<ports::output::IStorage>().to<adapters::secondary::PostgresStorage>().in(di::singleton),
            di::bind<ports::output::IEventPublisher>().to<adapters::secondary::LogEventPublisher>().in(di::singleton),
            di::bind<ports::output::IMemberDirectory>().to<adapters::secondary::EventingMemberDirectory>().in(di::singleton),
            di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),

            di::bind<ports::input::ILedger>().to<application::LedgerService>().in(di::singleton),
            di::bind<ports::input::IAssetRegistry>().to<application::AssetRegistry>().in(di::singleton),
            di::bind<ports::input::IAccountDirectory>().to<application::AccountDirectory>().in(di::singleton),
            di::bind<ports::input::ITransactionFactory>().to<application::TransactionFactory>().in(di::singleton),
            di::bind<ports::input::IBankService>().to<application::BankService>().in(di::singleton),
            di::bind<ports::input::IAutoRewardService>().to<application::AutoRewardService>().in(di::singleton),
            di::bind<ports::input::IRoleShopService>().to<application::RoleShopService>().in(di::singleton),
            di::bind<ports::input::IMonthlyAllowanceService>().to<application::MonthlyAllowanceService>().in(di::singleton),
            di::bind<ports::input::IVcEarningService>().to<application::VcEarningService>().in(di::singleton),
            di::bind<ports::input::IBettingService>().to<application::BettingService>().in(di::singleton)
        );

        // Сессии голосовых каналов хост присылает заново после рестарта
        auto voice = injector.create<std::shared_ptr<ports::input::IVcEarningService>>();
        voice->clearSessions();

        auto ledger = injector.create<std::shared_ptr<ports::input::ILedger>>();
        auto mismatches = ledger->verifyBalances();
        if (!mismatches.empty()) {
            std::cerr << "[LedgerApp] " << mismatches.size()
                      << " cached balances differ from postings, rebuilding" << std::endl;
            ledger->rebuildBalances();
        }

        dispatcher_ = injector.create<std::shared_ptr<adapters::primary::ActionDispatcher>>();
        jobs_ = injector.create<std::shared_ptr<adapters::primary::ScheduledJobs>>();

        std::cout << "[LedgerApp] Ready" << std::endl;
    }

private:
    std::shared_ptr<adapters::primary::ActionDispatcher> dispatcher_;
    std::shared_ptr<adapters::primary::ScheduledJobs> jobs_;

    std::atomic<bool> stopRequested_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace ledger
