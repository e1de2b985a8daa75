#pragma once

#include "app/CancellationToken.hpp"
#include "app/CliOptions.hpp"
#include "app/CommandDispatcher.hpp"
#include "app/InstanceRouter.hpp"
#include "app/SignalWatcher.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/instance/InstanceLock.hpp"
#include "infrastructure/ipc/CommandServer.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/presence/ConnectionSupervisor.hpp"
#include "infrastructure/storage/ProfileStore.hpp"

#include <QCoreApplication>
#include <QSocketNotifier>
#include <memory>

namespace customrpc::app {

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::ConnectionSupervisor& supervisor() { return *supervisor_; }
    CancellationToken& cancellationToken() { return token_; }

private:
    void initializeLogging();
    void attachFileLog();
    void initializeComponents();
    int runOwner();
    void handleStartupIntent();
    void shutdown();

    std::unique_ptr<QCoreApplication> qtApp_;
    CliParser cliParser_;
    bool cliValid_{false};

    CancellationToken token_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<SignalWatcher> signalWatcher_;
    std::unique_ptr<infra::ProfileStore> profiles_;
    std::unique_ptr<infra::ConnectionSupervisor> supervisor_;
    std::unique_ptr<CommandDispatcher> dispatcher_;
    std::unique_ptr<infra::InstanceLock> instanceLock_;
    std::unique_ptr<infra::CommandServer> commandServer_;
    std::unique_ptr<InstanceRouter> router_;
    std::unique_ptr<QSocketNotifier> commandNotifier_;
};

} // namespace customrpc::app
