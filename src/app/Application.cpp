#include "app/Application.hpp"

#include "infrastructure/presence/DiscordIpcClient.hpp"

#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <stdexcept>

namespace customrpc::app {

namespace {

constexpr const char* APP_VERSION = "1.0.0";

spdlog::level::level_enum parseLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace

Application::Application(int& argc, char** argv) {
    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("CustomRPC");
    qtApp_->setApplicationVersion(APP_VERSION);

    cliValid_ = cliParser_.parse(qtApp_->arguments());
    initializeLogging();
}

Application::~Application() {
    shutdown();
    spdlog::debug("Application shut down");
}

void Application::initializeLogging() {
    // Until this process owns the agent only warnings reach the console
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(cliParser_.options().debug ? spdlog::level::debug
                                                      : spdlog::level::warn);

    auto logger = std::make_shared<spdlog::logger>("customrpc", consoleSink);
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
}

void Application::attachFileLog() {
    auto logger = spdlog::default_logger();
    auto consoleLevel = cliParser_.options().debug ? spdlog::level::debug
                                                   : parseLevel(config_->config().logLevel);
    for (auto& sink : logger->sinks()) {
        sink->set_level(consoleLevel);
    }

    auto logPath = config_->logsDir() / "customrpc.log";
    try {
        std::filesystem::create_directories(config_->logsDir());
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        logger->sinks().push_back(fileSink);
    } catch (const std::exception& e) {
        spdlog::error("Cannot open log file {}: {}", logPath.string(), e.what());
        return;
    }

    spdlog::info("CustomRPC {} starting...", APP_VERSION);
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    // Configuration
    auto configDir =
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation).toStdString();
    if (configDir.empty()) {
        throw std::runtime_error("Cannot determine the configuration directory");
    }
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    if (!config_->load()) {
        spdlog::warn("Using default configuration");
    }
    const auto& cfg = config_->config();

    // Presence
    asioContext_ = std::make_unique<infra::AsioContext>("background", 1);
    profiles_ = std::make_unique<infra::ProfileStore>(config_->profilesDir());
    supervisor_ = std::make_unique<infra::ConnectionSupervisor>(
        *asioContext_, [] { return std::make_unique<infra::DiscordIpcClient>(); },
        std::chrono::seconds(cfg.livenessIntervalSeconds));
    dispatcher_ = std::make_unique<CommandDispatcher>(*supervisor_, *profiles_, *config_,
                                                      [this]() { token_.cancel(); });

    // Single instance and command channel
    instanceLock_ = std::make_unique<infra::InstanceLock>(
        config_->lockPath(), config_->portPath(), cfg.autoRecoverStaleLock);
    commandServer_ = std::make_unique<infra::CommandServer>();
    router_ = std::make_unique<InstanceRouter>(*instanceLock_, *commandServer_,
                                               std::chrono::milliseconds(cfg.commandTimeoutMs));
}

int Application::run() {
    const auto& options = cliParser_.options();
    if (!cliValid_) {
        std::cerr << cliParser_.errorText() << "\n\n" << cliParser_.helpText();
        return 1;
    }
    if (options.help) {
        std::cout << cliParser_.helpText();
        return 0;
    }
    if (options.version) {
        std::cout << "CustomRPC " << APP_VERSION << "\n";
        return 0;
    }

    initializeComponents();

    auto route = router_->start(
        options, [this](const core::Command& command) { return dispatcher_->dispatch(command); },
        config_->config().preferredPort);
    if (route.decision == RouteDecision::Forwarded) {
        return route.exitCode;
    }
    return runOwner();
}

int Application::runOwner() {
    attachFileLog();

    asioContext_->start();
    signalWatcher_ = std::make_unique<SignalWatcher>(*asioContext_, token_);
    signalWatcher_->start();

    token_.subscribe([app = qtApp_.get()]() {
        QMetaObject::invokeMethod(app, []() { QCoreApplication::quit(); }, Qt::QueuedConnection);
    });

    supervisor_->setStateListener(
        [notify = config_->config().notifyOnStatusChange](core::ConnectionState state) {
            if (notify) {
                spdlog::info("Discord RPC status: {}", core::connectionStateToString(state));
            }
        });

    commandNotifier_ = std::make_unique<QSocketNotifier>(commandServer_->nativeHandle(),
                                                         QSocketNotifier::Read);
    QObject::connect(commandNotifier_.get(), &QSocketNotifier::activated,
                     [this]() { router_->pollCommands(); });

    handleStartupIntent();

    if (!cliParser_.options().minimized && !config_->config().startMinimized) {
        spdlog::info("CustomRPC is running; use --quit to stop it");
    }

    int exitCode = qtApp_->exec();
    spdlog::info("Application shutting down...");
    shutdown();
    return exitCode;
}

void Application::handleStartupIntent() {
    if (auto command = cliParser_.options().toCommand()) {
        auto response = dispatcher_->dispatch(*command);
        if (InstanceRouter::report(response, std::cout, std::cerr) != 0) {
            spdlog::warn("Startup command {} failed", command->actionToString());
        }
        return;
    }

    const auto& cfg = config_->config();
    if (!cfg.autoConnect) {
        return;
    }
    if (cfg.autoConnectProfile.empty()) {
        spdlog::warn("Auto-connect is enabled but no profile is configured");
        return;
    }

    auto response = dispatcher_->dispatch(
        core::Command{core::CommandAction::Connect, cfg.autoConnectProfile});
    if (response.success) {
        spdlog::info("Auto-connect: {}", response.output.value_or("done"));
    } else {
        spdlog::warn("Auto-connect failed: {}", response.error);
    }
}

void Application::shutdown() {
    if (commandNotifier_) {
        commandNotifier_->setEnabled(false);
    }
    if (router_) {
        router_->shutdown();
    }
    if (supervisor_) {
        supervisor_->disconnect();
    }
    if (signalWatcher_) {
        signalWatcher_->stop();
    }
    if (asioContext_) {
        asioContext_->stop();
    }
}

} // namespace customrpc::app
