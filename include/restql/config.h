#pragma once
// ═══════════════════════════════════════════════════════════════════
//  restql/config.h — Schema-wide settings
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include <nlohmann/json.hpp>
#include <string>

namespace restql {

struct Config {
    // Page size when a query omits `limit`
    int defaultLimit = 100;

    // Weight of traversing one relation, relative to a scalar field
    double relationComplexityCost = 10.0;

    console::Level logLevel = console::Level::Info;

    // ── {"defaultLimit": 50, "relationComplexityCost": 10.0, "logLevel": "warn"} ──
    static Config fromJson(const nlohmann::json& j);

    // ── RESTQL_DEFAULT_LIMIT, RESTQL_LOG_LEVEL ──
    static Config fromEnv();

    // Push logLevel into the console logger
    void apply() const { console::setLevel(logLevel); }
};

} // namespace restql
