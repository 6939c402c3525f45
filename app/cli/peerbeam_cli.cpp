#include <any>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "Config.h"
#include "Constants.h"
#include "EventBus.h"
#include "Logger.h"
#include "PathUtils.h"
#include "TcpFrameTransport.h"
#include "TransferEvents.h"
#include "TransferReceiver.h"
#include "TransferSender.h"

using namespace PeerBeam;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_TRANSFER_FAILED = 1;
constexpr int EXIT_USAGE = 2;

// Grace period for the receiver to hang up after `end`
constexpr auto SENDER_LINGER = std::chrono::seconds(10);

volatile std::sig_atomic_t g_interrupted = 0;

void onSignal(int) {
    g_interrupted = 1;
}

struct CliOptions {
    std::string command;
    std::string file;
    std::string host;
    std::string outDir;
    std::string configPath;
    int port{-1};
    bool verbose{false};
};

void printUsage(const char* prog) {
    std::cout << "PeerBeam - end-to-end encrypted peer-to-peer file transfer" << std::endl;
    std::cout << "\nUsage:" << std::endl;
    std::cout << "  " << prog << " send <FILE> --host <ADDR> [--port <PORT>] [--config <PATH>] [--verbose]" << std::endl;
    std::cout << "  " << prog << " receive [--port <PORT>] [--out <DIR>] [--config <PATH>] [--verbose]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --host <ADDR>      Receiver address (send only)" << std::endl;
    std::cout << "  --port <PORT>      TCP port (default: listen_port, " << config::DEFAULT_LISTEN_PORT << ")" << std::endl;
    std::cout << "  --out <DIR>        Where to save the received file (default: output_dir, .)" << std::endl;
    std::cout << "  --config <PATH>    Extra config file, applied after " << std::endl;
    std::cout << "                     $XDG_CONFIG_HOME/peerbeam/peerbeam.conf" << std::endl;
    std::cout << "  --verbose          Debug logging" << std::endl;
    std::cout << "  --help             Show this help message" << std::endl;
}

bool parsePort(const std::string& text, int& port) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size() || value <= 0 || value > 65535) {
            return false;
        }
        port = value;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

/**
 * @return EXIT_OK to continue, -1 after --help, otherwise the process exit code
 */
int parseArguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return -1;
        }
        else if (arg == "--host" && i + 1 < argc) {
            options.host = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc) {
            if (!parsePort(argv[++i], options.port)) {
                std::cerr << "Error: invalid port '" << argv[i] << "'" << std::endl;
                return EXIT_USAGE;
            }
        }
        else if (arg == "--out" && i + 1 < argc) {
            options.outDir = argv[++i];
        }
        else if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        }
        else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown or incomplete option '" << arg << "'" << std::endl;
            return EXIT_USAGE;
        }
        else if (options.command.empty()) {
            options.command = arg;
        }
        else if (options.command == "send" && options.file.empty()) {
            options.file = arg;
        }
        else {
            std::cerr << "Error: unexpected argument '" << arg << "'" << std::endl;
            return EXIT_USAGE;
        }
    }

    if (options.command == "send") {
        if (options.file.empty() || options.host.empty()) {
            std::cerr << "Error: send needs <FILE> and --host" << std::endl;
            return EXIT_USAGE;
        }
    } else if (options.command == "receive") {
        if (!options.host.empty()) {
            std::cerr << "Error: --host is only valid for send" << std::endl;
            return EXIT_USAGE;
        }
    } else {
        std::cerr << "Error: expected 'send' or 'receive'" << std::endl;
        printUsage(argv[0]);
        return EXIT_USAGE;
    }
    return EXIT_OK;
}

bool isInteger(const std::string& value, int minimum) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        return used == value.size() && parsed >= minimum;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool loadConfig(const CliOptions& options, Config& settings) {
    std::vector<std::string> layers;
    try {
        layers.push_back(PathUtils::getDefaultConfigPath().string());
    } catch (const std::runtime_error& e) {
        Logger::instance().log(LogLevel::WARN, e.what(), "CLI");
    }

    if (!settings.loadLayered(layers)) {
        Logger::instance().log(LogLevel::DEBUG, "No default config file, using built-in defaults", "CLI");
    }
    if (!options.configPath.empty() && !settings.loadFromFile(options.configPath)) {
        std::cerr << "Error: cannot read config file " << options.configPath << std::endl;
        return false;
    }

    const std::unordered_map<std::string, Config::Validator> schema = {
        {"progress_interval_ms", [](const std::string&, const std::string& v) { return isInteger(v, 1); }},
        {"peer_key_timeout_sec", [](const std::string&, const std::string& v) { return isInteger(v, 0); }},
        {"listen_port", [](const std::string&, const std::string& v) {
            int port = 0;
            return parsePort(v, port);
        }},
        {"log_level", [](const std::string&, const std::string& v) {
            LogLevel level;
            return Logger::parseLevel(v, level);
        }},
    };

    std::string badKey;
    if (!settings.validate(schema, &badKey)) {
        std::cerr << "Error: invalid value for '" << badKey << "' in configuration" << std::endl;
        return false;
    }
    return true;
}

void configureLogging(const Config& settings, bool verbose) {
    auto& logger = Logger::instance();
    logger.setComponent("CLI");
    logger.setMaxFileSize(config::MAX_LOG_FILE_SIZE_MB);
    logger.setLogFile(settings.get("log_file", ""));

    LogLevel level = LogLevel::WARN;
    if (!Logger::parseLevel(settings.get("log_level", "warn"), level)) {
        level = LogLevel::WARN;
    }
    if (verbose) {
        level = LogLevel::DEBUG;
    }
    logger.setLevel(level);
}

std::string formatProgress(const ProgressUpdate& update) {
    char line[128];
    if (update.etaSeconds) {
        std::snprintf(line, sizeof(line), "%5.1f%% \xC2\xB7 %.2f MB/s \xC2\xB7 ETA %.0fs",
                      update.percent, update.bytesPerSecond / 1024.0 / 1024.0, *update.etaSeconds);
    } else {
        std::snprintf(line, sizeof(line), "%5.1f%% \xC2\xB7 %.2f MB/s",
                      update.percent, update.bytesPerSecond / 1024.0 / 1024.0);
    }
    return line;
}

void attachConsole(EventBus& bus) {
    bus.subscribe(events::PROGRESS, [](const std::any& data) {
        const auto& update = std::any_cast<const ProgressUpdate&>(data);
        std::cout << "\r" << formatProgress(update) << "   " << std::flush;
        if (update.percent >= 100.0) {
            std::cout << std::endl;
        }
    });
    bus.subscribe(events::STATUS, [](const std::any& data) {
        std::cout << std::any_cast<const std::string&>(data) << std::endl;
    });
    bus.subscribe(events::FINGERPRINT, [](const std::any& data) {
        std::cout << "Session fingerprint: " << std::any_cast<const std::string&>(data)
                  << "  (compare with your peer)" << std::endl;
    });
    bus.subscribe(events::FAILED, [](const std::any& data) {
        std::cerr << "Transfer failed: " << std::any_cast<const Error&>(data).toString() << std::endl;
    });
}

int runSend(const CliOptions& options, const Config& settings, const TransferOptions& transferOptions) {
    int port = options.port > 0 ? options.port : settings.getInt("listen_port", config::DEFAULT_LISTEN_PORT);

    auto connection = TcpFrameTransport::connectTo(options.host, port);
    if (!connection) {
        std::cerr << "Error: " << connection.error().toString() << std::endl;
        return EXIT_TRANSFER_FAILED;
    }
    std::unique_ptr<TcpFrameTransport> transport = std::move(connection.value());

    EventBus bus;
    attachConsole(bus);
    TransferSender sender(*transport, transferOptions, &bus);

    auto started = sender.start(options.file);
    if (!started) {
        return EXIT_TRANSFER_FAILED;
    }

    while (!sender.isFinished()) {
        if (g_interrupted) {
            transport->close();
            break;
        }
        transport->poll(config::POLL_INTERVAL_MS);
        sender.checkTimeout();
    }

    if (sender.state() == SenderState::DONE) {
        // Let the receiver verify and hang up first
        auto deadline = std::chrono::steady_clock::now() + SENDER_LINGER;
        while (transport->isOpen() && !g_interrupted && std::chrono::steady_clock::now() < deadline) {
            transport->poll(config::POLL_INTERVAL_MS);
        }
    }
    transport->close();

    return sender.state() == SenderState::DONE ? EXIT_OK : EXIT_TRANSFER_FAILED;
}

int runReceive(const CliOptions& options, const Config& settings) {
    int port = options.port > 0 ? options.port : settings.getInt("listen_port", config::DEFAULT_LISTEN_PORT);
    std::string outDir = !options.outDir.empty() ? options.outDir : settings.get("output_dir", ".");

    std::cout << "Waiting for a sender on port " << port << "..." << std::endl;
    auto connection = TcpFrameTransport::listenAndAccept(port);
    if (!connection) {
        std::cerr << "Error: " << connection.error().toString() << std::endl;
        return EXIT_TRANSFER_FAILED;
    }
    std::unique_ptr<TcpFrameTransport> transport = std::move(connection.value());

    EventBus bus;
    attachConsole(bus);
    TransferReceiver receiver(*transport, &bus);

    auto started = receiver.start();
    if (!started) {
        return EXIT_TRANSFER_FAILED;
    }

    while (!receiver.isFinished()) {
        if (g_interrupted) {
            transport->close();
            break;
        }
        transport->poll(config::POLL_INTERVAL_MS);
    }
    transport->close();

    if (receiver.state() != ReceiverState::COMPLETE) {
        return EXIT_TRANSFER_FAILED;
    }

    auto saved = receiver.saveTo(outDir);
    if (!saved) {
        std::cerr << "Error: " << saved.error().toString() << std::endl;
        return EXIT_TRANSFER_FAILED;
    }
    std::cout << "Saved to " << saved.value() << std::endl;
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    int parsed = parseArguments(argc, argv, options);
    if (parsed < 0) {
        return EXIT_OK;
    }
    if (parsed != EXIT_OK) {
        return parsed;
    }

    Config& settings = Config::instance();
    if (!loadConfig(options, settings)) {
        return EXIT_USAGE;
    }
    configureLogging(settings, options.verbose);

    auto transferOptions = TransferOptions::fromConfig(settings);
    if (!transferOptions) {
        std::cerr << "Error: " << transferOptions.error().toString() << std::endl;
        return EXIT_USAGE;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    Logger::instance().log(LogLevel::INFO, "=== PeerBeam " + options.command + " ===", "CLI");

    if (options.command == "send") {
        return runSend(options, settings, transferOptions.value());
    }
    return runReceive(options, settings);
}
