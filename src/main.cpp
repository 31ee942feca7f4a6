/**
 * HTTPSTASH - Shared HTTP Cache Store
 *
 * Maintenance tool for a cache directory shared by HTTP caching engines.
 */

#include "config/config.hpp"
#include "http/message.hpp"
#include "store/store.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitMiss = 1;
constexpr int kExitError = 2;

httpstash::util::LogConfig to_log_config(const httpstash::config::LogSettings& settings) {
    httpstash::util::LogConfig log_config;
    log_config.level = httpstash::util::Logger::parse_level(settings.level).value_or(httpstash::util::LogLevel::Info);
    log_config.file_path = settings.file;
    log_config.max_file_size_mb = settings.max_file_size_mb;
    log_config.max_files = settings.max_files;
    log_config.enable_console = settings.enable_console;
    log_config.enable_colors = settings.enable_colors;
    return log_config;
}

bool require_argument(const std::vector<std::string>& args, const std::string& command) {
    if (args.size() < 2) {
        std::cerr << "Missing argument for " << command << "\n";
        return false;
    }
    return true;
}

int run_lookup(httpstash::store::Store& store, const std::string& url) {
    auto request = httpstash::http::Request::create(url);
    auto response = store.lookup(request);
    if (!response) {
        std::cout << "MISS " << request.uri() << "\n";
        return kExitMiss;
    }

    std::cout << "HIT " << request.uri() << "\n";
    std::cout << "Status: " << response->status() << "\n";
    for (const auto& field : response->headers()) {
        std::cout << field.name_string() << ": " << field.value() << "\n";
    }
    if (response->is_file()) {
        std::cout << "File: " << response->file().string() << "\n";
    } else {
        std::cout << "Body: " << response->body().size() << " bytes\n";
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        httpstash::config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return kExitOk;
        }

        auto config = config_manager.get_config();
        httpstash::util::Logger::init(to_log_config(config.logging));

        auto args = config_manager.positional();
        if (args.empty()) {
            httpstash::config::ConfigManager::print_help(argv[0]);
            return kExitError;
        }

        httpstash::store::Store store(httpstash::store::StoreOptions::from_settings(config.store));
        const auto& command = args[0];

        if (command == "prune") {
            store.prune();
            return kExitOk;
        }

        if (command == "clear") {
            store.clear();
            return kExitOk;
        }

        if (command == "purge") {
            if (!require_argument(args, command)) {
                return kExitError;
            }
            bool purged = store.purge(args[1]);
            std::cout << (purged ? "Purged " : "Not cached: ") << args[1] << "\n";
            return purged ? kExitOk : kExitMiss;
        }

        if (command == "invalidate-tags") {
            if (!require_argument(args, command)) {
                return kExitError;
            }
            std::vector<std::string> tags;
            for (std::size_t i = 1; i < args.size(); ++i) {
                for (auto& tag : httpstash::http::split_list(args[i])) {
                    tags.push_back(std::move(tag));
                }
            }
            return store.invalidate_tags(tags) ? kExitOk : kExitMiss;
        }

        if (command == "lookup") {
            if (!require_argument(args, command)) {
                return kExitError;
            }
            return run_lookup(store, args[1]);
        }

        std::cerr << "Unknown command: " << command << "\n";
        return kExitError;

    } catch (const httpstash::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return kExitError;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitError;
    }
}
