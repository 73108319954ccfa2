/*
 * main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: skybridge command line entry point

**************************************************/

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "app/bridge_runtime.hpp"
#include "config/bridge_config.hpp"
#include "device/common/bridge_exceptions.hpp"
#include "logging/log_setup.hpp"

namespace {

std::atomic<bool> g_stopRequested{false};

void signalHandler(int /*signal*/) { g_stopRequested = true; }

struct CommandLine {
    std::string command;
    std::vector<std::string> arguments;
    std::optional<std::string> configPath;
    std::optional<std::string> logLevel;
    std::optional<double> timeoutSeconds;
    bool follow{false};
    bool help{false};
};

void printUsage(const char* program) {
    std::cout
        << "Usage: " << program << " [options] <command> [args]\n"
        << "Commands:\n"
        << "  discover                Run a discovery pass\n"
        << "  list                    Show available and connected devices\n"
        << "  connect <id>            Connect a device and show its details\n"
        << "  disconnect <id>         Disconnect a device\n"
        << "  info <id>               Show a device without connecting\n"
        << "  events <id> [--follow]  Show buffered events, or stream them\n"
        << "Options:\n"
        << "  --config <file>         JSON configuration file\n"
        << "  --log-level <level>     trace|debug|info|warn|error|critical|off\n"
        << "  --timeout <seconds>     Discovery window\n"
        << "  --help, -h              Show this help message\n";
}

auto parseCommandLine(int argc, char* argv[]) -> CommandLine {
    using skybridge::device::InvalidParameterException;

    CommandLine cli;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cli.configPath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            cli.logLevel = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            try {
                cli.timeoutSeconds = std::stod(argv[++i]);
            } catch (const std::exception&) {
                throw InvalidParameterException(
                    "Invalid --timeout value: " + std::string(argv[i]),
                    "Pass the discovery window in seconds, e.g. --timeout 5");
            }
        } else if (arg == "--follow" || arg == "-f") {
            cli.follow = true;
        } else if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else if (arg.starts_with("--")) {
            throw InvalidParameterException("Unknown option: " + arg,
                                            "Run with --help for usage");
        } else if (cli.command.empty()) {
            cli.command = arg;
        } else {
            cli.arguments.push_back(arg);
        }
    }
    return cli;
}

auto requireDeviceId(const CommandLine& cli) -> const std::string& {
    if (cli.arguments.empty()) {
        throw skybridge::device::InvalidParameterException(
            "Command '" + cli.command + "' needs a device id",
            "Pass an id from 'discover' or a connection string like "
            "name@host:port");
    }
    return cli.arguments.front();
}

void printJson(const nlohmann::json& value) {
    std::cout << value.dump(2) << std::endl;
}

void followEvents(skybridge::app::BridgeRuntime& runtime,
                  const std::string& deviceId) {
    auto& events = runtime.events();
    auto queue = events.subscribe(deviceId);
    spdlog::info("Streaming events for {}, press Ctrl+C to stop", deviceId);
    while (!g_stopRequested) {
        if (auto event = queue->popFor(std::chrono::milliseconds(500))) {
            std::cout << event->toJson().dump() << std::endl;
        }
    }
    events.unsubscribe(deviceId, queue);
}

auto runCommand(skybridge::app::BridgeRuntime& runtime, const CommandLine& cli)
    -> int {
    auto& connections = runtime.connections();

    if (cli.command == "discover") {
        std::optional<std::chrono::milliseconds> window;
        if (cli.timeoutSeconds) {
            window = std::chrono::milliseconds(
                static_cast<long long>(*cli.timeoutSeconds * 1000.0));
        }
        auto found = runtime.discovery().discover(window);
        printJson({{"discovered", skybridge::device::toJson(found)},
                   {"count", found.size()},
                   {"available", connections.availableDevices()}});
    } else if (cli.command == "list") {
        printJson({{"available", connections.availableDevices()},
                   {"connected", connections.connectedDevices()}});
    } else if (cli.command == "connect") {
        const auto& id = requireDeviceId(cli);
        connections.connect(id);
        printJson(connections.deviceInfo(id));
    } else if (cli.command == "disconnect") {
        const auto& id = requireDeviceId(cli);
        connections.disconnect(id);
        printJson({{"device_id", id}, {"connected", false}});
    } else if (cli.command == "info") {
        printJson(connections.resolve(requireDeviceId(cli)).toJson());
    } else if (cli.command == "events") {
        const auto& id = requireDeviceId(cli);
        connections.connect(id);
        if (cli.follow) {
            followEvents(runtime, id);
        } else {
            printJson(runtime.events().getEvents(id));
        }
    } else {
        throw skybridge::device::InvalidParameterException(
            "Unknown command: " + cli.command, "Run with --help for usage");
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    skybridge::logging::setupLogging({});

    try {
        auto cli = parseCommandLine(argc, argv);
        if (cli.help || cli.command.empty()) {
            printUsage(argv[0]);
            return cli.help ? 0 : 1;
        }

        skybridge::config::BridgeConfig config;
        if (cli.configPath) {
            config.loadFile(*cli.configPath);
        }
        config.applyEnvironment();
        if (cli.logLevel) {
            config.logging.level = *cli.logLevel;
        }
        if (cli.timeoutSeconds) {
            config.discovery.timeoutSeconds = *cli.timeoutSeconds;
        }
        skybridge::logging::setupLogging(config.logging);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        skybridge::app::BridgeRuntime runtime(std::move(config));
        int status = runCommand(runtime, cli);
        runtime.shutdown();
        return status;
    } catch (const skybridge::device::BridgeException& e) {
        spdlog::error("{}", e.info().toString());
        printJson(e.toJson());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled error: {}", e.what());
        printJson(skybridge::device::ErrorInfo(
                      skybridge::device::ErrorKind::Internal, e.what())
                      .toJson());
        return 1;
    }
}
