#pragma once

#include "core/types/Command.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QStringList>
#include <optional>
#include <string>

namespace customrpc::app {

/**
 * @brief Options given on the agent's command line.
 */
struct CliOptions {
    std::optional<std::string> profile;
    bool connect{false};
    bool disconnect{false};
    bool quit{false};
    bool listProfiles{false};
    bool minimized{false};
    bool debug{false};
    bool help{false};
    bool version{false};

    /**
     * @brief Checks whether the invocation asks for a command rather than the agent.
     */
    [[nodiscard]] bool isHeadless() const;

    /**
     * @brief Translates the options into the single command they request.
     *
     * Precedence: --list-profiles, --quit, --disconnect, --connect (with the
     * optional --profile), then --profile alone as load_profile.
     *
     * @return The command, or nullopt when no command was requested.
     */
    [[nodiscard]] std::optional<core::Command> toCommand() const;
};

/**
 * @brief Parses the command line with QCommandLineParser.
 */
class CliParser {
public:
    CliParser();

    /**
     * @brief Parses the arguments, including the program name at index 0.
     * @return False on unknown options or missing values; see errorText().
     */
    bool parse(const QStringList& arguments);

    const CliOptions& options() const { return options_; }

    std::string errorText() const { return parser_.errorText().toStdString(); }
    std::string helpText() const { return parser_.helpText().toStdString(); }

private:
    QCommandLineParser parser_;
    QCommandLineOption profileOption_;
    QCommandLineOption connectOption_;
    QCommandLineOption disconnectOption_;
    QCommandLineOption quitOption_;
    QCommandLineOption listProfilesOption_;
    QCommandLineOption minimizedOption_;
    QCommandLineOption debugOption_;
    QCommandLineOption helpOption_;
    QCommandLineOption versionOption_;
    CliOptions options_;
};

} // namespace customrpc::app
