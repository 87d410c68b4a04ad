/**
 * @file main.cpp
 * @brief log_courier_send: ship messages and watches from the command line.
 * @author log_courier contributors
 *
 *   log_courier_send --connect "tcp(host=10.0.0.5)" --level warning "disk almost full"
 *   tail -f app.log | log_courier_send --stdin --session tail
 */

#include "client/client.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace log_courier;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cerr << "log_courier_send v" << kLibraryVersion << std::endl;
}

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::string descriptor = "tcp()";
    std::string app_name = "log_courier_send";
    std::string session = std::string{kMainSessionName};
    Level level = Level::Message;
    std::string log_dir;
    bool verbose = false;
    bool read_stdin = false;
    bool clear_first = false;
    uint32_t repeat = 1;
    uint32_t interval_ms = 0;
    std::vector<std::pair<std::string, std::string>> watches;
    std::vector<std::string> messages;
};

[[noreturn]] void usage(int code) {
    std::cout << "Usage: log_courier_send [OPTIONS] [MESSAGE...]\n"
              << "  --config <path>       TOML configuration file\n"
              << "  --connect <desc>      Connection descriptor (default: tcp())\n"
              << "  --app <name>          Application name\n"
              << "  --session <name>      Session name (default: Main)\n"
              << "  --level <level>       debug|verbose|message|warning|error|fatal or 0-5\n"
              << "  --watch <name=value>  Send a watch (repeatable)\n"
              << "  --stdin               Send every line read from stdin\n"
              << "  --repeat <n>          Send the messages n times\n"
              << "  --interval <ms>       Pause between repetitions\n"
              << "  --clear               Clear the console before sending\n"
              << "  --log-dir <path>      Write diagnostics to NDJSON files\n"
              << "  --verbose             Print debug diagnostics to stderr\n"
              << "  --help, -h            Show this help message\n";
    std::exit(code);
}

uint32_t parse_count(const std::string& flag, const std::string& text) {
    try {
        return static_cast<uint32_t>(std::stoul(text));
    } catch (const std::exception&) {
        std::cerr << "Invalid value for " << flag << ": " << text << std::endl;
        usage(2);
    }
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                usage(2);
            }
            return argv[++i];
        };

        if (arg == "--config") {
            args.config_path = next();
        } else if (arg == "--connect") {
            args.descriptor = next();
        } else if (arg == "--app") {
            args.app_name = next();
        } else if (arg == "--session") {
            args.session = next();
        } else if (arg == "--level") {
            std::string text = next();
            auto level = parse_level(text);
            if (!level || *level == Level::Control) {
                std::cerr << "Invalid level: " << text << std::endl;
                usage(2);
            }
            args.level = *level;
        } else if (arg == "--watch") {
            std::string pair = next();
            auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Expected name=value for --watch, got: " << pair << std::endl;
                usage(2);
            }
            args.watches.emplace_back(pair.substr(0, eq), pair.substr(eq + 1));
        } else if (arg == "--stdin") {
            args.read_stdin = true;
        } else if (arg == "--repeat") {
            args.repeat = parse_count(arg, next());
        } else if (arg == "--interval") {
            args.interval_ms = parse_count(arg, next());
        } else if (arg == "--clear") {
            args.clear_first = true;
        } else if (arg == "--log-dir") {
            args.log_dir = next();
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(0);
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            usage(2);
        } else {
            args.messages.push_back(std::move(arg));
        }
    }
    return args;
}

/// Reports lifecycle events on stderr.
class ConsoleListener : public ConnectionListener {
public:
    void on_connect(bool reconnect) override {
        std::cerr << (reconnect ? "reconnected" : "connected") << std::endl;
    }
    void on_disconnect() override {
        std::cerr << "connection lost" << std::endl;
    }
    void on_error(const Error& error) override {
        std::cerr << "error [" << to_string(error.kind) << "]: " << error.message << std::endl;
    }
};

std::shared_ptr<Logger> make_logger(const CLIArgs& args) {
    if (!args.log_dir.empty()) {
        return std::make_shared<Logger>(
            std::make_unique<RotatingFileSink>(args.log_dir, "log_courier_send"), LogLevel::Info);
    }
    if (args.verbose) {
        return std::make_shared<Logger>(std::make_unique<StreamSink>(std::clog), LogLevel::Debug);
    }
    return std::make_shared<Logger>(std::make_unique<StreamSink>(std::clog), LogLevel::Warn);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    print_banner();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Client client(args.app_name, std::make_shared<ConsoleListener>(), make_logger(args));
    client.set_default_level(args.level);

    bool connected_by_config = false;
    if (args.config_path) {
        auto loaded = client.load_configuration(*args.config_path);
        if (!loaded) {
            std::cerr << "Failed to load config: " << loaded.error().message << std::endl;
            return 1;
        }
        connected_by_config = client.enabled();
    }

    if (!connected_by_config) {
        auto connected = client.connect(args.descriptor);
        if (!connected) {
            std::cerr << "Invalid connection descriptor: " << connected.error().message << std::endl;
            return 1;
        }
    }

    auto session = client.session(args.session);
    if (args.clear_first) session->clear_all();

    for (uint32_t round = 0; round < args.repeat && !g_shutdown_requested; ++round) {
        for (const auto& message : args.messages) {
            session->log(args.level, message);
        }
        for (const auto& [name, value] : args.watches) {
            session->watch(args.level, name, WatchValue{value, WatchType::String});
        }
        if (args.interval_ms > 0 && round + 1 < args.repeat) {
            std::this_thread::sleep_for(std::chrono::milliseconds(args.interval_ms));
        }
    }

    if (args.read_stdin) {
        std::string line;
        while (!g_shutdown_requested && std::getline(std::cin, line)) {
            if (!line.empty()) session->log(args.level, line);
        }
    }

    client.disconnect();

    const SenderStats stats = client.stats();
    std::cerr << "sent " << stats.packets_sent
              << ", backlogged " << stats.backlog.count
              << ", dropped " << (stats.queue.dropped + stats.backlog.dropped + stats.packets_discarded)
              << std::endl;
    return stats.backlog.count == 0 ? 0 : 3;
}
