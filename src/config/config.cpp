/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include "util/errors.hpp"
#include "util/logger.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace httpstash::config {

namespace log_component = util::log_component;

namespace {

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

// Digits only; "-1" or anything above UINT32_MAX is rejected rather than wrapped
std::uint32_t parse_threshold(const std::string& value, const std::string& source) {
    std::uint32_t parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
        throw ConfigError("Invalid " + source + " value: " + value);
    }
    return parsed;
}

int parse_int(const std::string& value, const std::string& source) {
    try {
        std::size_t consumed = 0;
        auto parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError("Invalid " + source + " value: " + value);
    }
}

} // namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const StoreSettings& s) {
    j = nlohmann::json{
        {"cache_directory", s.cache_directory},
        {"prune_threshold", s.prune_threshold},
        {"cache_tags_header", s.cache_tags_header},
        {"generate_content_digests", s.generate_content_digests},
        {"gzip_level", s.gzip_level}
    };
}

void from_json(const nlohmann::json& j, StoreSettings& s) {
    if (j.contains("cache_directory")) j.at("cache_directory").get_to(s.cache_directory);
    if (j.contains("prune_threshold")) {
        const auto& threshold = j.at("prune_threshold");
        if (!threshold.is_number_unsigned() ||
            threshold.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            throw ConfigError("Invalid prune_threshold value: " + threshold.dump());
        }
        s.prune_threshold = threshold.get<std::uint32_t>();
    }
    if (j.contains("cache_tags_header")) j.at("cache_tags_header").get_to(s.cache_tags_header);
    if (j.contains("generate_content_digests")) j.at("generate_content_digests").get_to(s.generate_content_digests);
    if (j.contains("gzip_level")) j.at("gzip_level").get_to(s.gzip_level);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"store", c.store},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("store")) j.at("store").get_to(c.store);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

// Config validation
void Config::validate() const {
    if (store.gzip_level < 0 || store.gzip_level > 9) {
        throw ConfigError("Configuration error: store.gzip_level must be between 0 and 9");
    }
    if (store.cache_tags_header.empty()) {
        throw ConfigError("Configuration error: store.cache_tags_header cannot be empty");
    }
    if (!util::Logger::parse_level(logging.level)) {
        throw ConfigError("Configuration error: unknown logging.level \"" + logging.level + "\"");
    }
    if (!logging.file.empty() && (logging.max_file_size_mb == 0 || logging.max_files == 0)) {
        throw ConfigError("Configuration error: logging.max_file_size_mb and logging.max_files must be non-zero");
    }

    HTTPSTASH_LOG_DEBUG(log_component::Config, "Configuration validated successfully");
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[]) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    // Start with defaults
    config_ = Config{};
    config_path_.clear();
    positional_.clear();

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path_ = argv[++i];
        } else if (arg.starts_with("--config=")) {
            config_path_ = arg.substr(9);
        }
    }

    // Load from config file if specified
    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    // Apply environment variable overrides
    apply_environment_overrides();

    // Apply CLI overrides (highest precedence)
    apply_cli_overrides(argc, argv);

    // Validate final configuration
    config_.validate();

    HTTPSTASH_LOG_DEBUG(log_component::Config, "Configuration loaded successfully");
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

std::vector<std::string> ConfigManager::positional() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return positional_;
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "HTTPSTASH - Shared HTTP Cache Store\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS] COMMAND [ARGS]\n"
              << "\n"
              << "Commands:\n"
              << "  prune                     Remove expired entries\n"
              << "  clear                     Remove every entry\n"
              << "  purge URL                 Remove the entry stored for URL\n"
              << "  invalidate-tags TAG[,TAG] Remove entries carrying any of the tags\n"
              << "  lookup URL                Show the stored response for URL\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                Show this help message and exit\n"
              << "  -c, --config FILE         Path to JSON configuration file\n"
              << "  -d, --cache-dir DIR       Cache and lock directory\n"
              << "  --prune-threshold N       Writes between prune passes (default: 500, 0 disables)\n"
              << "  --tags-header NAME        Response header holding cache tags (default: Cache-Tags)\n"
              << "  --no-content-digests      Inline bodies instead of deduplicating them\n"
              << "  --gzip-level N            Compress stored bodies (0-9, default: 0)\n"
              << "  --log-level LEVEL         trace/debug/info/warn/error/critical/off\n"
              << "\n"
              << "Environment Variables:\n"
              << "  HTTPSTASH_CONFIG            Path to configuration file\n"
              << "  HTTPSTASH_CACHE_DIR         Cache and lock directory\n"
              << "  HTTPSTASH_PRUNE_THRESHOLD   Writes between prune passes\n"
              << "  HTTPSTASH_TAGS_HEADER       Response header holding cache tags\n"
              << "  HTTPSTASH_CONTENT_DIGESTS   Deduplicate bodies (true/false)\n"
              << "  HTTPSTASH_GZIP_LEVEL        Compression level for stored bodies\n"
              << "  HTTPSTASH_LOG_LEVEL         Log level\n"
              << "  HTTPSTASH_LOG_FILE          Log file path (stderr if not set)\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"store\": {\n"
              << "      \"cache_directory\": \"/var/cache/httpstash\",\n"
              << "      \"prune_threshold\": 500,\n"
              << "      \"cache_tags_header\": \"Cache-Tags\",\n"
              << "      \"generate_content_digests\": true,\n"
              << "      \"gzip_level\": 0\n"
              << "    },\n"
              << "    \"logging\": {\n"
              << "      \"level\": \"info\",\n"
              << "      \"file\": \"\"\n"
              << "    }\n"
              << "  }\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<httpstash::config::Config>();
        HTTPSTASH_LOG_DEBUG(log_component::Config, "Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    // Check for config file path from environment
    if (config_path_.empty()) {
        if (auto env = get_env("HTTPSTASH_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    if (auto env = get_env("HTTPSTASH_CACHE_DIR")) {
        config_.store.cache_directory = *env;
        HTTPSTASH_LOG_DEBUG(log_component::Config, "Applied HTTPSTASH_CACHE_DIR={}", config_.store.cache_directory);
    }

    if (auto env = get_env("HTTPSTASH_PRUNE_THRESHOLD")) {
        config_.store.prune_threshold = parse_threshold(*env, "HTTPSTASH_PRUNE_THRESHOLD");
        HTTPSTASH_LOG_DEBUG(log_component::Config, "Applied HTTPSTASH_PRUNE_THRESHOLD={}", config_.store.prune_threshold);
    }

    if (auto env = get_env("HTTPSTASH_TAGS_HEADER")) {
        config_.store.cache_tags_header = *env;
        HTTPSTASH_LOG_DEBUG(log_component::Config, "Applied HTTPSTASH_TAGS_HEADER={}", config_.store.cache_tags_header);
    }

    if (auto env = get_env("HTTPSTASH_CONTENT_DIGESTS")) {
        config_.store.generate_content_digests = parse_bool(*env);
        HTTPSTASH_LOG_DEBUG(log_component::Config, "Applied HTTPSTASH_CONTENT_DIGESTS={}", config_.store.generate_content_digests);
    }

    if (auto env = get_env("HTTPSTASH_GZIP_LEVEL")) {
        config_.store.gzip_level = parse_int(*env, "HTTPSTASH_GZIP_LEVEL");
        HTTPSTASH_LOG_DEBUG(log_component::Config, "Applied HTTPSTASH_GZIP_LEVEL={}", config_.store.gzip_level);
    }

    // Logging settings
    if (auto env = get_env("HTTPSTASH_LOG_LEVEL")) {
        config_.logging.level = *env;
    }

    if (auto env = get_env("HTTPSTASH_LOG_FILE")) {
        config_.logging.file = *env;
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    auto value_of = [&](int& i, const std::string& arg, const std::string& name) -> std::optional<std::string> {
        if (arg == name) {
            if (i + 1 >= argc) {
                throw ConfigError("Missing value for " + name);
            }
            return std::string(argv[++i]);
        }
        if (arg.starts_with(name + "=")) {
            return arg.substr(name.size() + 1);
        }
        return std::nullopt;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        // Skip already processed args
        if (arg == "--config" || arg == "-c") { ++i; continue; }
        if (arg.starts_with("--config=")) continue;

        if (arg == "-d") {
            if (i + 1 >= argc) {
                throw ConfigError("Missing value for -d");
            }
            config_.store.cache_directory = argv[++i];
        } else if (auto dir = value_of(i, arg, "--cache-dir")) {
            config_.store.cache_directory = *dir;
        } else if (auto threshold = value_of(i, arg, "--prune-threshold")) {
            config_.store.prune_threshold = parse_threshold(*threshold, "--prune-threshold");
        } else if (auto header = value_of(i, arg, "--tags-header")) {
            config_.store.cache_tags_header = *header;
        } else if (arg == "--no-content-digests") {
            config_.store.generate_content_digests = false;
        } else if (auto level = value_of(i, arg, "--gzip-level")) {
            config_.store.gzip_level = parse_int(*level, "--gzip-level");
        } else if (auto log_level = value_of(i, arg, "--log-level")) {
            config_.logging.level = *log_level;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            throw ConfigError("Unknown option: " + arg);
        } else {
            positional_.push_back(arg);
        }
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace httpstash::config
