// include/IssuerApp.hpp
#pragma once

#include <boost/di.hpp>

// Ports
#include "ports/input/IIssuerService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "ports/output/ICvvProvider.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/IssuerSettings.hpp"
#include "settings/SecuritySettings.hpp"
#include "settings/SweeperSettings.hpp"

// Application
#include "application/IssuerService.hpp"
#include "application/HoldSweeper.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/PostgresLedgerRepository.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include "adapters/secondary/cvv/HmacCvvProvider.hpp"
#include "adapters/secondary/cvv/HsmCvvProvider.hpp"
#include "adapters/secondary/cvv/SoftDes3MacDevice.hpp"

#include "utils/PanHasher.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace di = boost::di;

namespace issuer {

/**
 * @brief Issuer Service Application
 *
 * Композиционный корень: читает настройки, выбирает реализацию реестра
 * (pg / mem) и CVV-провайдера (hmac / hsm), связывает компоненты через
 * Boost.DI и крутит HoldSweeper до stop().
 *
 * Template Method: run() вызывает loadEnvironment(), configureInjection(), start().
 */
class IssuerApp {
public:
    IssuerApp() { std::cout << "[IssuerApp] Initializing..." << std::endl; }
    virtual ~IssuerApp() {
        if (sweeper_) {
            sweeper_->stop();
        }
        std::cout << "[IssuerApp] Shutting down..." << std::endl;
    }

    IssuerApp(const IssuerApp&) = delete;
    IssuerApp& operator=(const IssuerApp&) = delete;

    void run(int argc, char* argv[]) {
        loadEnvironment(argc, argv);
        configureInjection();
        start();
    }

    /**
     * @brief Запросить остановку; безопасно из обработчика сигнала
     */
    void stop() {
        stopRequested_ = true;
    }

    std::shared_ptr<ports::input::IIssuerService> service() const { return service_; }

protected:
    virtual void loadEnvironment(int /*argc*/, char* /*argv*/[]) {
        issuerSettings_ = std::make_shared<settings::IssuerSettings>();
        securitySettings_ = std::make_shared<settings::SecuritySettings>();
        std::cout << "[IssuerApp] Environment loaded (backend=" << issuerSettings_->getBackend()
                  << ", cvv=" << issuerSettings_->getCvvProvider()
                  << ", tz=" << issuerSettings_->getExpiryTz() << ")" << std::endl;
    }

    virtual void configureInjection() {
        std::cout << "[IssuerApp] Configuring DI..." << std::endl;

        // Шаг 1: реализации, выбираемые в рантайме
        auto panHasher = std::make_shared<utils::PanHasher>(securitySettings_->panHashKey());
        auto repository = createRepository(panHasher);
        auto cvvProvider = createCvvProvider();
        auto expiry = std::make_shared<domain::ExpiryCalculator>(issuerSettings_->toExpirySettings());
        auto config = std::make_shared<domain::IssuerConfig>(issuerSettings_->toIssuerConfig());

        // Шаг 2: основной injector с instance binding
        auto injector = di::make_injector(
            di::bind<settings::SweeperSettings>().in(di::singleton),
            di::bind<ports::output::ILedgerRepository>().to(repository),
            di::bind<ports::output::ICvvProvider>().to(cvvProvider),
            di::bind<domain::ExpiryCalculator>().to(expiry),
            di::bind<domain::IssuerConfig>().to(config),
            di::bind<ports::input::IIssuerService>().to<application::IssuerService>().in(di::singleton)
        );

        service_ = injector.create<std::shared_ptr<ports::input::IIssuerService>>();

        auto sweeperSettings = injector.create<std::shared_ptr<settings::SweeperSettings>>();
        sweeper_ = std::make_unique<application::HoldSweeper>(
            repository,
            std::chrono::milliseconds{sweeperSettings->getIntervalMs()},
            sweeperSettings->getBatchSize());

        repository->ping();
        std::cout << "[IssuerApp] Ready" << std::endl;
    }

    virtual void start() {
        sweeper_->start();
        while (!stopRequested_) {
            std::this_thread::sleep_for(std::chrono::milliseconds{200});
        }
        sweeper_->stop();
    }

private:
    std::shared_ptr<settings::IssuerSettings> issuerSettings_;
    std::shared_ptr<settings::SecuritySettings> securitySettings_;
    std::shared_ptr<ports::input::IIssuerService> service_;
    std::unique_ptr<application::HoldSweeper> sweeper_;
    std::atomic<bool> stopRequested_{false};

    std::shared_ptr<ports::output::ILedgerRepository> createRepository(
        const std::shared_ptr<utils::PanHasher>& panHasher)
    {
        const auto backend = issuerSettings_->getBackend();

        if (backend == "pg") {
            auto dbInjector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<utils::PanHasher>().to(panHasher)
            );
            return dbInjector.create<std::shared_ptr<adapters::secondary::PostgresLedgerRepository>>();
        }

        if (backend == "mem") {
            if (!issuerSettings_->isMemBackendAllowed()) {
                throw std::runtime_error(
                    "ISSUER_REPO_BACKEND=mem requires ISSUER_ALLOW_MEM_BACKEND=true");
            }
            std::cerr << "[IssuerApp] WARNING: in-memory ledger, data is lost on exit" << std::endl;
            return std::make_shared<adapters::secondary::InMemoryLedgerRepository>(panHasher);
        }

        throw std::runtime_error("Unknown ISSUER_REPO_BACKEND: " + backend);
    }

    std::shared_ptr<ports::output::ICvvProvider> createCvvProvider() {
        const auto provider = issuerSettings_->getCvvProvider();

        if (provider == "hmac") {
            return std::make_shared<adapters::secondary::cvv::HmacCvvProvider>(securitySettings_->cvkKey());
        }
        if (provider == "hsm") {
            auto device = std::make_shared<adapters::secondary::cvv::SoftDes3MacDevice>(
                securitySettings_->hsmCvkKey());
            return std::make_shared<adapters::secondary::cvv::HsmCvvProvider>(device);
        }

        throw std::runtime_error("Unknown ISSUER_CVV_PROVIDER: " + provider);
    }
};

} // namespace issuer
