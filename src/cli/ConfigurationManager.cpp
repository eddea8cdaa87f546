/**
 * @file ConfigurationManager.cpp
 * @brief .env loading and database connection settings
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ConfigurationManager.hpp"
#include "pgexport.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace pgexport {

namespace {

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

bool is_blank(const std::string& text) {
    return trim(text).empty();
}

std::string env_or_default(const char* key, const std::string& default_value) {
    const char* value = std::getenv(key);
    if (value == nullptr || *value == '\0') {
        return default_value;
    }
    return value;
}

}  // namespace

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    load_from_stream(file);
    return true;
}

void ConfigurationManager::load_from_stream(std::istream& input) {
    std::string line;
    while (std::getline(input, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.starts_with("export ")) {
            line = trim(line.substr(7));
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        config_values_[key] = value;
    }
}

void ConfigurationManager::apply_to_environment() const {
    for (const auto& [key, value] : config_values_) {
        setenv(key.c_str(), value.c_str(), 0);
    }
}

DatabaseConfig DatabaseConfig::from_environment() {
    DatabaseConfig config;
    config.driver = env_or_default("DB_DRIVER", config.driver);
    config.user = env_or_default("DB_USER", config.user);
    config.password = env_or_default("DB_PASS", "");
    config.host = env_or_default("DB_HOST", config.host);
    config.name = env_or_default("DB_NAME", config.name);
    config.ssl_mode = env_or_default("DB_SSLMODE", "");

    std::string port = env_or_default("DB_PORT", "");
    if (!port.empty()) {
        int parsed = 0;
        auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), parsed);
        if (ec == std::errc() && end == port.data() + port.size()) {
            config.port = parsed;
        }
    }
    return config;
}

void DatabaseConfig::validate() const {
    if (port < 1 || port > 65535) {
        throw ConfigurationError("configuration error: DB_PORT must be a valid port number (1-65535)");
    }
    if (is_blank(host)) {
        throw ConfigurationError("configuration error: DB_HOST cannot be empty or contain only whitespace");
    }
    if (is_blank(name)) {
        throw ConfigurationError("configuration error: DB_NAME cannot be empty or contain only whitespace");
    }
    if (is_blank(user)) {
        throw ConfigurationError("configuration error: DB_USER cannot be empty or contain only whitespace");
    }
}

std::string DatabaseConfig::connection_string() const {
    std::string dsn = driver + "://" + percent_encode(user) + ":" + percent_encode(password) + "@" +
                      host + ":" + std::to_string(port) + "/" + percent_encode(name);
    if (!is_blank(ssl_mode)) {
        dsn += "?sslmode=" + percent_encode(ssl_mode);
    }
    return dsn;
}

std::string percent_encode(const std::string& text) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                          c == '-' || c == '.' || c == '_' || c == '~';
        if (unreserved) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

}  // namespace pgexport
