/**
 * HTTPSTASH - Shared HTTP Cache Store
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (HTTPSTASH_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 */

#ifndef HTTPSTASH_CONFIG_CONFIG_HPP
#define HTTPSTASH_CONFIG_CONFIG_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace httpstash::config {

/**
 * Store configuration
 */
struct StoreSettings {
    std::string cache_directory;                 // Empty = backends must be injected
    std::uint32_t prune_threshold{500};          // Writes between prune passes, 0 = never
    std::string cache_tags_header{"Cache-Tags"};
    bool generate_content_digests{true};
    int gzip_level{0};                           // 0-9, 0 = store bodies uncompressed
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Complete application configuration
 */
struct Config {
    StoreSettings store;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     *
     * @throws httpstash::ConfigError
     */
    void validate() const;
};

/**
 * Configuration manager - handles loading and parsing
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * Arguments that are not options are kept, in order, as positional().
     *
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws httpstash::ConfigError on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    /**
     * Non-option arguments from the command line
     */
    std::vector<std::string> positional() const;

    std::filesystem::path get_config_path() const;

    /**
     * Print help message to stdout
     */
    static void print_help(const char* program_name);

private:
    void load_from_file(const std::filesystem::path& path);

    void apply_environment_overrides();

    void apply_cli_overrides(int argc, char* argv[]);

    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
    std::vector<std::string> positional_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const StoreSettings& s);
void from_json(const nlohmann::json& j, StoreSettings& s);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace httpstash::config

#endif // HTTPSTASH_CONFIG_CONFIG_HPP
