#pragma once

#include <string>
#include <map>
#include <vector>
#include <stdexcept>
#include "nlohmann/json.hpp"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Per-1K-token rates for one model, as read from the config file
struct RateEntry {
    double prompt = 0.0;
    double completion = 0.0;
};

class Config {
public:
    Config();

    // Load configuration from the config file, then apply environment overrides
    void load();

    // Apply environment variable overrides only (load() calls this)
    void apply_environment();

    // Validation
    void validate() const;

    // Human-readable dump with secrets masked
    std::string describe() const;

    // Get user's home directory (tries HOME first, then getpwuid)
    static std::string get_home_directory();

    // Get default config path (XDG-compliant)
    static std::string get_default_config_path();

    // Set custom config file path (for command-line override)
    void set_config_path(const std::string& config_path) { custom_config_path_ = config_path; }

    // Set provider with validation
    void set_provider(const std::string& provider);

    // Providers this build knows about
    static std::vector<std::string> get_available_providers();

    // Whole-string numeric parsing; throws ConfigError naming `what` on junk or overflow
    static double parse_double(const std::string& text, const std::string& what);
    static long parse_long(const std::string& text, const std::string& what);

    // Public configuration variables
    std::string provider;

    // OpenAI-compatible
    std::string openai_api_key;
    std::string openai_api_base;
    std::string openai_default_model;

    // Bedrock
    std::string aws_region;
    std::string aws_access_key_id;
    std::string aws_secret_access_key;
    std::string aws_session_token;
    std::string bedrock_default_model;
    std::map<std::string, std::string> bedrock_model_aliases;

    // Generation defaults
    double temperature;
    int max_tokens;

    // Messenger side
    int retry_attempts;
    long timeout_seconds;
    std::string server_url;

    // Responder side
    std::string host;
    int port;

    // Outbound TLS
    bool ssl_verify;
    std::string ca_bundle;

    // Logging: trace, debug, info, warn, error, fatal
    std::string log_level;

    // Cost table extensions (merged over the built-in table)
    std::map<std::string, RateEntry> rates;
    std::map<std::string, std::string> cost_aliases;

    nlohmann::json json;  // Parsed config JSON

private:
    std::string get_config_path() const;
    void set_defaults();
    bool is_provider_available(const std::string& provider) const;

    std::string custom_config_path_;  // Custom config file path (optional)
};
