#include "agent_log.hpp"
#include "errors.hpp"
#include "tail_engine.hpp"
#include "watch_config.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <thread>

using namespace log_collector;

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

void print_usage(const char* program) {
    std::cout << "log_collector - tails new lines from the log files of a directory\n\n";
    std::cout << "Usage: " << program << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config FILE       JSON config file (options below override it)\n";
    std::cout << "  --dir DIR           Directory to watch\n";
    std::cout << "  --ext EXT           File extension to watch, repeatable (default: log)\n";
    std::cout << "  --all               Watch every file regardless of extension\n";
    std::cout << "  --tail N            Lines per file printed at startup (default: 1)\n";
    std::cout << "  --maxsize BYTES     Max bytes read per file per poll (default: 1048576)\n";
    std::cout << "  --interval SECONDS  Poll interval (default: 0.1)\n";
    std::cout << "  --json              Print one JSON object per line\n";
    std::cout << "  --help              Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program << " --dir /var/log/myapp --ext log --ext txt --tail 10\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string dir;
    std::set<std::string> extensions;
    bool all_files = false;
    bool json_output = false;
    std::optional<std::size_t> tail_lines;
    std::optional<std::size_t> maxsize;
    std::optional<double> interval;

    // Parse command line arguments
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            }
            else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            }
            else if (arg == "--dir" && i + 1 < argc) {
                dir = argv[++i];
            }
            else if (arg == "--ext" && i + 1 < argc) {
                extensions.insert(argv[++i]);
            }
            else if (arg == "--all") {
                all_files = true;
            }
            else if (arg == "--tail" && i + 1 < argc) {
                tail_lines = parse_count("--tail", argv[++i]);
            }
            else if (arg == "--maxsize" && i + 1 < argc) {
                maxsize = parse_count("--maxsize", argv[++i]);
            }
            else if (arg == "--interval" && i + 1 < argc) {
                interval = std::stod(argv[++i]);
            }
            else if (arg == "--json") {
                json_output = true;
            }
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        WatchConfig config;
        if (!config_path.empty()) {
            config = load_config(config_path);
        }
        if (!dir.empty()) config.watch_dir = dir;
        if (all_files) config.extensions.clear();
        else if (!extensions.empty()) config.extensions = extensions;
        if (tail_lines) config.tail_lines = *tail_lines;
        if (maxsize) config.maxsize = *maxsize;
        if (interval) config.interval = *interval;

        if (config.watch_dir.empty()) {
            std::cerr << "No directory given (use --dir or --config)" << std::endl;
            print_usage(argv[0]);
            return 1;
        }

        // Diagnostics go to stderr so stdout carries only tailed lines
        AgentLog::set_sink([](AgentLog::Level level, const std::string& component,
                              const std::string& message) {
            std::cerr << "[" << component << "] " << AgentLog::level_name(level) << ": "
                      << message << std::endl;
        });

        TailEngine engine(config, [json_output](const std::string& path,
                                                const std::vector<std::string>& lines) {
            for (const auto& line : lines) {
                if (json_output) {
                    nlohmann::json j{{"path", path}, {"line", line}};
                    // Tailed bytes need not be valid UTF-8
                    std::cout << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
                } else {
                    std::cout << path << ": " << line << '\n';
                }
            }
            std::cout.flush();
        });

        // Main loop
        const auto poll = std::chrono::duration<double>(config.interval);
        while (running) {
            engine.run_once();
            std::this_thread::sleep_for(poll);
        }

        AgentLog::log("Main", "Shutting down");
        engine.close();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
