#include "courier.h"
#include "config.h"
#include "nlohmann/json.hpp"

#include <fstream>
#include <filesystem>
#include <sstream>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <cmath>
#include <pwd.h>
#include <unistd.h>
#include <algorithm>

using json = nlohmann::json;

namespace {

std::string env_or_empty(const char* name) {
    const char* value = getenv(name);
    if (value && value[0] != '\0') {
        return std::string(value);
    }
    return "";
}

std::string mask(const std::string& secret) {
    return secret.empty() ? "" : "(set)";
}

} // namespace

Config::Config() {
    set_defaults();
}

void Config::set_defaults() {
    provider = "openai";

    openai_api_key = "";
    openai_api_base = "https://api.openai.com/v1";
    openai_default_model = "gpt-4";

    aws_region = "us-east-1";
    aws_access_key_id = "";
    aws_secret_access_key = "";
    aws_session_token = "";
    bedrock_default_model = "anthropic.claude-3-5-sonnet-20241022-v2:0";
    bedrock_model_aliases.clear();

    temperature = 0.7;
    max_tokens = 1000;

    retry_attempts = 3;
    timeout_seconds = 120;
    server_url = "http://localhost:8000";

    host = "0.0.0.0";
    port = 8000;

    ssl_verify = true;
    ca_bundle = "";

    log_level = "info";

    rates.clear();
    cost_aliases.clear();
}

std::string Config::get_home_directory() {
    // Try HOME environment variable first (respects user's explicit setting)
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home);
    }

    // Fallback to system passwd database
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }

    throw ConfigError("Unable to determine home directory");
}

std::string Config::get_default_config_path() {
    // Use XDG base directory
    std::string config_home;
    const char* xdg_config = getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        config_home = xdg_config;
    } else {
        config_home = get_home_directory() + "/.config";
    }
    return config_home + "/courier/config.json";
}

std::string Config::get_config_path() const {
    if (!custom_config_path_.empty()) {
        return custom_config_path_;
    }
    return get_default_config_path();
}

void Config::load() {
    std::string config_path = get_config_path();

    dprintf(1, "Loading config from: %s", config_path.c_str());

    if (!std::filesystem::exists(config_path)) {
        if (!custom_config_path_.empty()) {
            throw ConfigError("Config file not found: " + config_path);
        }
        dprintf(1, "Config file not found, using defaults: %s", config_path.c_str());
        apply_environment();
        return;
    }

    try {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("Failed to open config file: " + config_path);
        }

        file >> json;

        if (json.contains("provider")) {
            provider = json["provider"].get<std::string>();
        }

        if (json.contains("openai")) {
            const auto& openai = json["openai"];
            if (openai.contains("api_key")) {
                openai_api_key = openai["api_key"].get<std::string>();
            }
            if (openai.contains("api_base")) {
                openai_api_base = openai["api_base"].get<std::string>();
            }
            if (openai.contains("default_model")) {
                openai_default_model = openai["default_model"].get<std::string>();
            }
        }

        if (json.contains("bedrock")) {
            const auto& bedrock = json["bedrock"];
            if (bedrock.contains("region")) {
                aws_region = bedrock["region"].get<std::string>();
            }
            if (bedrock.contains("access_key_id")) {
                aws_access_key_id = bedrock["access_key_id"].get<std::string>();
            }
            if (bedrock.contains("secret_access_key")) {
                aws_secret_access_key = bedrock["secret_access_key"].get<std::string>();
            }
            if (bedrock.contains("session_token")) {
                aws_session_token = bedrock["session_token"].get<std::string>();
            }
            if (bedrock.contains("default_model")) {
                bedrock_default_model = bedrock["default_model"].get<std::string>();
            }
            if (bedrock.contains("model_aliases")) {
                for (const auto& [alias, id] : bedrock["model_aliases"].items()) {
                    bedrock_model_aliases[alias] = id.get<std::string>();
                }
            }
        }

        if (json.contains("temperature")) {
            temperature = json["temperature"].get<double>();
        }
        if (json.contains("max_tokens")) {
            max_tokens = json["max_tokens"].get<int>();
        }
        if (json.contains("retry_attempts")) {
            retry_attempts = json["retry_attempts"].get<int>();
        }
        if (json.contains("timeout_seconds")) {
            timeout_seconds = json["timeout_seconds"].get<long>();
        }
        if (json.contains("server_url")) {
            server_url = json["server_url"].get<std::string>();
        }
        if (json.contains("host")) {
            host = json["host"].get<std::string>();
        }
        if (json.contains("port")) {
            port = json["port"].get<int>();
        }
        if (json.contains("ssl_verify")) {
            ssl_verify = json["ssl_verify"].get<bool>();
        }
        if (json.contains("ca_bundle")) {
            ca_bundle = json["ca_bundle"].get<std::string>();
        }
        if (json.contains("log_level")) {
            log_level = json["log_level"].get<std::string>();
        }

        // Rates: {"model": {"prompt": x, "completion": y}}
        if (json.contains("rates")) {
            for (const auto& [model, entry] : json["rates"].items()) {
                RateEntry rate;
                rate.prompt = entry.value("prompt", 0.0);
                rate.completion = entry.value("completion", 0.0);
                rates[model] = rate;
            }
        }
        if (json.contains("cost_aliases")) {
            for (const auto& [alias, id] : json["cost_aliases"].items()) {
                cost_aliases[alias] = id.get<std::string>();
            }
        }

        dprintf(1, "Loaded configuration from: %s", config_path.c_str());

    } catch (const json::exception& e) {
        throw ConfigError("Invalid JSON in config file: " + std::string(e.what()));
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConfigError("Error loading config: " + std::string(e.what()));
    }

    apply_environment();
}

void Config::apply_environment() {
    std::string value;

    if (!(value = env_or_empty("AI_PROVIDER")).empty()) provider = value;

    if (!(value = env_or_empty("OPENAI_API_KEY")).empty()) openai_api_key = value;
    if (!(value = env_or_empty("OPENAI_API_BASE")).empty()) openai_api_base = value;
    if (!(value = env_or_empty("OPENAI_DEFAULT_MODEL")).empty()) openai_default_model = value;

    if (!(value = env_or_empty("AWS_REGION")).empty()) aws_region = value;
    if (!(value = env_or_empty("AWS_ACCESS_KEY_ID")).empty()) aws_access_key_id = value;
    if (!(value = env_or_empty("AWS_SECRET_ACCESS_KEY")).empty()) aws_secret_access_key = value;
    if (!(value = env_or_empty("AWS_SESSION_TOKEN")).empty()) aws_session_token = value;
    if (!(value = env_or_empty("BEDROCK_DEFAULT_MODEL")).empty()) bedrock_default_model = value;

    if (!(value = env_or_empty("SERVER_URL")).empty()) server_url = value;
    if (!(value = env_or_empty("COURIER_HOST")).empty()) host = value;
    if (!(value = env_or_empty("LOG_LEVEL")).empty()) log_level = value;
    if (!(value = env_or_empty("COURIER_CA_BUNDLE")).empty()) ca_bundle = value;
    if (!(value = env_or_empty("COURIER_SSL_VERIFY")).empty()) {
        if (value == "0" || value == "false" || value == "no") {
            ssl_verify = false;
        } else if (value == "1" || value == "true" || value == "yes") {
            ssl_verify = true;
        } else {
            throw ConfigError("Invalid COURIER_SSL_VERIFY value: " + value);
        }
    }

    // Numeric overrides
    if (!(value = env_or_empty("AI_TEMPERATURE")).empty()) temperature = parse_double(value, "AI_TEMPERATURE");
    if (!(value = env_or_empty("AI_MAX_TOKENS")).empty()) max_tokens = static_cast<int>(parse_long(value, "AI_MAX_TOKENS"));
    if (!(value = env_or_empty("RETRY_ATTEMPTS")).empty()) retry_attempts = static_cast<int>(parse_long(value, "RETRY_ATTEMPTS"));
    if (!(value = env_or_empty("TIMEOUT_SECONDS")).empty()) timeout_seconds = parse_long(value, "TIMEOUT_SECONDS");
    if (!(value = env_or_empty("COURIER_PORT")).empty()) port = static_cast<int>(parse_long(value, "COURIER_PORT"));
}

double Config::parse_double(const std::string& text, const std::string& what) {
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
        throw ConfigError("Invalid numeric value for " + what + ": '" + text + "'");
    }
    return value;
}

long Config::parse_long(const std::string& text, const std::string& what) {
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        throw ConfigError("Invalid integer value for " + what + ": '" + text + "'");
    }
    return value;
}

void Config::set_provider(const std::string& provider_name) {
    if (!is_provider_available(provider_name)) {
        auto available = get_available_providers();
        std::string available_str;
        for (size_t i = 0; i < available.size(); ++i) {
            if (i > 0) available_str += ", ";
            available_str += available[i];
        }
        throw ConfigError("Provider '" + provider_name + "' is not available. Available providers: " + available_str);
    }
    provider = provider_name;
}

bool Config::is_provider_available(const std::string& name) const {
    auto available = get_available_providers();
    return std::find(available.begin(), available.end(), name) != available.end();
}

std::vector<std::string> Config::get_available_providers() {
    return {"openai", "bedrock", "mock"};
}

void Config::validate() const {
    if (!is_provider_available(provider)) {
        throw ConfigError("Unknown provider: " + provider);
    }
    if (temperature < 0.0 || temperature > 2.0) {
        throw ConfigError("temperature must be between 0 and 2");
    }
    if (max_tokens < 1) {
        throw ConfigError("max_tokens must be positive");
    }
    if (retry_attempts < 1) {
        throw ConfigError("retry_attempts must be at least 1");
    }
    if (timeout_seconds < 1) {
        throw ConfigError("timeout_seconds must be at least 1");
    }
    if (port < 1 || port > 65535) {
        throw ConfigError("port must be between 1 and 65535");
    }
    if (!Logger::is_level_name(log_level)) {
        throw ConfigError("Unknown log_level: " + log_level);
    }
    for (const auto& [model, rate] : rates) {
        if (rate.prompt < 0.0 || rate.completion < 0.0) {
            throw ConfigError("Negative rate for model: " + model);
        }
    }

    dprintf(1, "Configuration validation passed");
}

std::string Config::describe() const {
    std::ostringstream out;
    out << "=== Courier Configuration ===\n";
    out << "provider = " << provider << "\n";
    out << "openai.api_key = " << mask(openai_api_key) << "\n";
    out << "openai.api_base = " << openai_api_base << "\n";
    out << "openai.default_model = " << openai_default_model << "\n";
    out << "bedrock.region = " << aws_region << "\n";
    out << "bedrock.access_key_id = " << mask(aws_access_key_id) << "\n";
    out << "bedrock.secret_access_key = " << mask(aws_secret_access_key) << "\n";
    out << "bedrock.default_model = " << bedrock_default_model << "\n";
    out << "temperature = " << temperature << "\n";
    out << "max_tokens = " << max_tokens << "\n";
    out << "retry_attempts = " << retry_attempts << "\n";
    out << "timeout_seconds = " << timeout_seconds << "\n";
    out << "server_url = " << server_url << "\n";
    out << "host = " << host << "\n";
    out << "port = " << port << "\n";
    out << "ssl_verify = " << (ssl_verify ? "true" : "false") << "\n";
    out << "ca_bundle = " << ca_bundle << "\n";
    out << "log_level = " << log_level << "\n";
    return out.str();
}
