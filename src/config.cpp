// ═══════════════════════════════════════════════════════════════════
//  config.cpp — Config loading from JSON and the environment
// ═══════════════════════════════════════════════════════════════════

#include "restql/config.h"
#include <cstdlib>
#include <stdexcept>

namespace restql {

namespace {

console::Level levelFromName(const std::string& name) {
    auto level = console::parseLevel(name);
    if (!level) {
        throw std::runtime_error("Unknown log level '" + name + "'");
    }
    return *level;
}

void checkLimit(int limit) {
    if (limit < 1) {
        throw std::runtime_error("defaultLimit must be >= 1, got " + std::to_string(limit));
    }
}

} // namespace

Config Config::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }
    Config config;
    try {
        config.defaultLimit = j.value("defaultLimit", config.defaultLimit);
        config.relationComplexityCost =
            j.value("relationComplexityCost", config.relationComplexityCost);
        if (j.contains("logLevel")) {
            config.logLevel = levelFromName(j.at("logLevel").get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }
    checkLimit(config.defaultLimit);
    return config;
}

Config Config::fromEnv() {
    Config config;
    if (const char* limit = std::getenv("RESTQL_DEFAULT_LIMIT")) {
        try {
            config.defaultLimit = std::stoi(limit);
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("RESTQL_DEFAULT_LIMIT is not a number: ") + limit);
        }
        checkLimit(config.defaultLimit);
    }
    if (const char* level = std::getenv("RESTQL_LOG_LEVEL")) {
        config.logLevel = levelFromName(level);
    }
    return config;
}

} // namespace restql
