#include "SessionApp.hpp"

#include "application/SessionManager.hpp"
#include "application/SessionStore.hpp"
#include "adapters/secondary/OpenSslTokenGenerator.hpp"
#include "adapters/secondary/Sha256FingerprintProvider.hpp"
#include "adapters/secondary/SystemClock.hpp"

#include <boost/di.hpp>
#include <iostream>

namespace di = boost::di;

namespace session {

SessionApp::SessionApp(settings::SecuritySettings settings)
    : settings_(std::make_shared<settings::SecuritySettings>(std::move(settings)))
{
    std::cout << "[SessionApp] Initializing..." << std::endl;
    configureInjection();
}

SessionApp::~SessionApp()
{
    stop();
    std::cout << "[SessionApp] Destroyed" << std::endl;
}

void SessionApp::configureInjection()
{
    std::cout << "[SessionApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(
        // Settings
        di::bind<settings::SecuritySettings>().to(settings_),

        // Secondary Adapters
        di::bind<ports::output::IClock>()
            .to<adapters::secondary::SystemClock>()
            .in(di::singleton),

        di::bind<ports::output::ITokenGenerator>()
            .to<adapters::secondary::OpenSslTokenGenerator>()
            .in(di::singleton),

        di::bind<ports::output::IFingerprintProvider>()
            .to<adapters::secondary::Sha256FingerprintProvider>()
            .in(di::singleton),

        // Store + Application Service
        di::bind<application::SessionStore>()
            .in(di::singleton),

        di::bind<ports::input::ISessionManager>()
            .to<application::SessionManager>()
            .in(di::singleton)
    );

    sessionManager_ = injector.create<std::shared_ptr<ports::input::ISessionManager>>();
    sessionGuard_ = injector.create<std::shared_ptr<adapters::primary::SessionGuard>>();
    cleanupScheduler_ = std::make_shared<application::CleanupScheduler>(sessionManager_, *settings_);

    std::cout << "[SessionApp] DI Injector configured:" << std::endl;
    std::cout << "  ✓ Secondary Adapters (3 bindings)" << std::endl;
    std::cout << "  ✓ SessionManager, SessionGuard, CleanupScheduler" << std::endl;
}

void SessionApp::start()
{
    cleanupScheduler_->start();
    std::cout << "[SessionApp] Started" << std::endl;
}

void SessionApp::stop()
{
    if (!cleanupScheduler_ || !cleanupScheduler_->isRunning()) {
        return;
    }
    cleanupScheduler_->stop();
    std::cout << "[SessionApp] Session manager shutdown complete" << std::endl;
}

bool SessionApp::isRunning() const
{
    return cleanupScheduler_ && cleanupScheduler_->isRunning();
}

nlohmann::json SessionApp::statsJson() const
{
    nlohmann::json stats = sessionManager_->getStats();
    stats["config"] = settings_->toJson();
    stats["cleanup"] = {
        {"running", cleanupScheduler_->isRunning()},
        {"sweeps", cleanupScheduler_->sweepCount()},
        {"failed_sweeps", cleanupScheduler_->failedSweeps()},
        {"removed_total", cleanupScheduler_->totalRemoved()}
    };
    return stats;
}

} // namespace session
