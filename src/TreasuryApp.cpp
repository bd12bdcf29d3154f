// src/TreasuryApp.cpp
#include "TreasuryApp.hpp"

#include <boost/di.hpp>
#include <boost/algorithm/string.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/KeeperSettings.hpp"
#include "settings/SimulationSettings.hpp"
#include "settings/VaultSettings.hpp"
#include "settings/StrategySettings.hpp"
#include "settings/OracleSettings.hpp"

// Application
#include "application/OracleGuard.hpp"
#include "application/ReserveStrategy.hpp"
#include "application/Vault.hpp"

// Secondary Adapters
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "adapters/secondary/persistence/InMemoryVaultStateRepository.hpp"
#include "adapters/secondary/persistence/InMemoryStrategyStateRepository.hpp"
#include "adapters/secondary/persistence/PostgresVaultStateRepository.hpp"
#include "adapters/secondary/persistence/PostgresStrategyStateRepository.hpp"
#include "adapters/secondary/venues/SimulatedCustody.hpp"
#include "adapters/secondary/venues/SimulatedSwapVenue.hpp"
#include "adapters/secondary/venues/SimulatedLendingVenue.hpp"

#include <iostream>
#include <vector>

namespace di = boost::di;

namespace treasury {

// ============================================================================
// Конфигурационные константы
// ============================================================================
namespace config
{
    const std::string ADMIN_ACCOUNT = "treasury-admin";
    constexpr auto FEED_REFRESH_INTERVAL = std::chrono::seconds{30};
}

// ============================================================================
// TreasuryApp Implementation
// ============================================================================

TreasuryApp::TreasuryApp()
{
    std::cout << "[TreasuryApp] Application created" << std::endl;
}

TreasuryApp::~TreasuryApp()
{
    if (keeper_) {
        keeper_->stop();
    }
    if (eventConsumer_) {
        eventConsumer_->stop();
    }
    std::cout << "[TreasuryApp] Application destroyed" << std::endl;
}

void TreasuryApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    start();
}

void TreasuryApp::stop()
{
    stopRequested_ = true;
    waitCondition_.notify_all();
}

void TreasuryApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[TreasuryApp] Loading environment..." << std::endl;
    for (int i = 1; i < argc; ++i) {
        std::cout << "[TreasuryApp] Ignoring argument: " << argv[i] << std::endl;
    }
    std::cout << "[TreasuryApp] Environment loaded (configuration via ENV)" << std::endl;
}

void TreasuryApp::configureInjection()
{
    std::cout << "[TreasuryApp] Configuring Boost.DI injection..." << std::endl;

    auto keeperSettings = std::make_shared<settings::KeeperSettings>();
    auto simulation = std::make_shared<settings::SimulationSettings>();
    auto clock = std::make_shared<adapters::secondary::SystemClock>();

    // ========================================================================
    // Шаг 1: Хранилище состояния и шина событий
    // ========================================================================

    std::shared_ptr<ports::output::IVaultStateRepository> vaultRepository;
    std::shared_ptr<ports::output::IStrategyStateRepository> strategyRepository;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher;

    if (keeperSettings->useInMemoryStorage()) {
        std::cout << "[TreasuryApp] Storage: in-memory, events: in-memory bus" << std::endl;
        vaultRepository = std::make_shared<adapters::secondary::InMemoryVaultStateRepository>();
        strategyRepository = std::make_shared<adapters::secondary::InMemoryStrategyStateRepository>();

        auto bus = std::make_shared<adapters::secondary::InMemoryEventBus>();
        eventPublisher = bus;
        eventConsumer_ = bus;
    } else {
        std::cout << "[TreasuryApp] Storage: PostgreSQL, events: RabbitMQ" << std::endl;
        auto storageInjector = di::make_injector(
            di::bind<settings::DbSettings>().in(di::singleton)
        );
        vaultRepository = storageInjector.create<std::shared_ptr<adapters::secondary::PostgresVaultStateRepository>>();
        strategyRepository = storageInjector.create<std::shared_ptr<adapters::secondary::PostgresStrategyStateRepository>>();

        // Один экземпляр RabbitMQAdapter для Publisher и Consumer
        auto rabbitInjector = di::make_injector(
            di::bind<settings::RabbitMQSettings>().in(di::singleton)
        );
        auto rabbitMQAdapter = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();
        eventPublisher = rabbitMQAdapter;
        eventConsumer_ = rabbitMQAdapter;
    }

    // ========================================================================
    // Шаг 2: Симулированные площадки
    // ========================================================================

    auto custody = std::make_shared<adapters::secondary::SimulatedCustody>();
    priceFeed_ = std::make_shared<adapters::secondary::SimulatedPriceOracle>(clock);
    priceFeed_->setPrice(domain::AssetId::STABLE, simulation->getStablePrice());
    priceFeed_->setPrice(domain::AssetId::VOLATILE, simulation->getVolatilePrice());
    priceFeed_->setPrice(domain::AssetId::SHARE, simulation->getSharePrice());

    auto swapVenue = std::make_shared<adapters::secondary::SimulatedSwapVenue>(
        custody, priceFeed_, clock, simulation->getSwapFeeBps());
    auto lendingVenue = std::make_shared<adapters::secondary::SimulatedLendingVenue>(
        custody, clock, simulation->getLendingApyBps());

    std::vector<std::string> seedAccounts;
    auto seedList = simulation->getSeedAccounts();
    boost::split(seedAccounts, seedList, boost::is_any_of(","));
    for (auto& account : seedAccounts) {
        boost::trim(account);
        if (account.empty()) continue;
        custody->credit(account, domain::AssetId::STABLE, simulation->getSeedBalance());
        std::cout << "[TreasuryApp] Seeded " << account << " with "
                  << simulation->getSeedBalance() << " stable units" << std::endl;
    }

    // ========================================================================
    // Шаг 3: Основной injector
    // ========================================================================

    auto injector = di::make_injector(
        di::bind<settings::IVaultSettings>().to<settings::VaultSettings>().in(di::singleton),
        di::bind<settings::IStrategySettings>().to<settings::StrategySettings>().in(di::singleton),
        di::bind<settings::IOracleSettings>().to<settings::OracleSettings>().in(di::singleton),

        di::bind<ports::output::IClock>().to(std::static_pointer_cast<ports::output::IClock>(clock)),
        di::bind<ports::output::IAssetCustody>().to(std::static_pointer_cast<ports::output::IAssetCustody>(custody)),
        di::bind<ports::output::IPriceOracle>().to(std::static_pointer_cast<ports::output::IPriceOracle>(priceFeed_)),
        di::bind<ports::output::ISwapVenue>().to(std::static_pointer_cast<ports::output::ISwapVenue>(swapVenue)),
        di::bind<ports::output::ILendingVenue>().to(std::static_pointer_cast<ports::output::ILendingVenue>(lendingVenue)),
        di::bind<ports::output::IVaultStateRepository>().to(vaultRepository),
        di::bind<ports::output::IStrategyStateRepository>().to(strategyRepository),
        di::bind<ports::output::IEventPublisher>().to(eventPublisher),
        di::bind<ports::output::IEventConsumer>().to(eventConsumer_),

        di::bind<application::OracleGuard>().in(di::singleton),
        di::bind<ports::input::IReserveStrategy>().to<application::ReserveStrategy>().in(di::singleton),
        di::bind<ports::input::IVaultService>().to<application::Vault>().in(di::singleton)
    );

    strategy_ = injector.create<std::shared_ptr<ports::input::IReserveStrategy>>();
    vault_ = injector.create<std::shared_ptr<ports::input::IVaultService>>();
    vault_->setStrategy(domain::CallContext::administrator(config::ADMIN_ACCOUNT), strategy_);

    // ========================================================================
    // Шаг 4: Обработчики команд и хранитель эпох
    // ========================================================================

    // VaultCommandHandler вызывает subscribe() в конструкторе
    commandHandler_ = injector.create<std::shared_ptr<application::VaultCommandHandler>>();
    keeper_ = std::make_shared<application::EpochKeeper>(
        vault_, keeperSettings->getAccount(), keeperSettings->getPollInterval());

    std::cout << "[TreasuryApp] Injection configured" << std::endl;
}

void TreasuryApp::start()
{
    // Consumer запускается ПОСЛЕ регистрации всех handlers
    std::cout << "[TreasuryApp] Starting event consumer..." << std::endl;
    eventConsumer_->start();
    keeper_->start();

    std::cout << "[TreasuryApp] Ready: totalAssets=" << vault_->totalAssets()
              << " nextEpochAt=" << vault_->nextEpochAt() << std::endl;

    std::unique_lock<std::mutex> lock(waitMutex_);
    while (!stopRequested_) {
        waitCondition_.wait_for(lock, config::FEED_REFRESH_INTERVAL, [this]() {
            return stopRequested_.load();
        });
        // Симулированный фид: цены не меняются, но остаются свежими
        priceFeed_->touch();
    }

    std::cout << "[TreasuryApp] Stopping..." << std::endl;
    keeper_->stop();
    eventConsumer_->stop();
}

} // namespace treasury
