#include <relgraph/db/settings_store.h>
#include <relgraph/db/sqlite_connection.h>

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace relgraph {
namespace db {

SettingsStore::SettingsStore(SQLiteConnection& db_conn) : m_db_conn(db_conn) {}

std::optional<std::string> SettingsStore::get(const std::string& key) {
    Statement stmt(m_db_conn, "SELECT value FROM settings WHERE key = ?1");
    stmt.bindText(1, key);
    if (!stmt.step()) return std::nullopt;
    return stmt.columnText(0).value_or(std::string());
}

void SettingsStore::put(const std::string& key, const std::string& value) {
    Statement stmt(m_db_conn,
                   "INSERT INTO settings (key, value) VALUES (?1, ?2) "
                   "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
    stmt.bindText(1, key);
    stmt.bindText(2, value);
    stmt.step();
}

std::optional<std::string> SettingsStore::loadNonEmpty(const char* key) {
    std::optional<std::string> value = get(key);
    if (value && value->empty()) return std::nullopt;
    return value;
}

std::optional<float> SettingsStore::loadPositiveFloat(const char* key) {
    std::optional<std::string> value = get(key);
    if (!value) return std::nullopt;
    try {
        size_t consumed = 0;
        float parsed = std::stof(*value, &consumed);
        if (consumed == value->size() && std::isfinite(parsed) && parsed > 0.0f) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        // stof throws invalid_argument / out_of_range; both fall through to the warning.
    }
    std::cerr << "Warning: Ignoring invalid " << key << " setting '" << *value << "'" << std::endl;
    return std::nullopt;
}

ThemeType SettingsStore::loadTheme() {
    std::optional<std::string> stored = get(SettingKeys::kTheme);
    if (!stored) return ThemeType::DARK;
    if (auto theme = ThemeUtils::themeFromString(*stored)) {
        return *theme;
    }
    std::cerr << "Warning: Unknown theme setting '" << *stored << "'" << std::endl;
    return ThemeType::DARK;
}

void SettingsStore::saveTheme(ThemeType theme) {
    put(SettingKeys::kTheme, ThemeUtils::themeToString(theme));
}

graph::ForceDirectedLayout::LayoutParams SettingsStore::loadLayoutParams() {
    graph::ForceDirectedLayout::LayoutParams params;
    if (auto charge = loadPositiveFloat(SettingKeys::kChargeStrength)) {
        params.charge_strength = *charge;
    }
    if (auto multiplier = loadPositiveFloat(SettingKeys::kCollisionRadiusMultiplier)) {
        params.collision_radius_multiplier = *multiplier;
    }
    return params;
}

void SettingsStore::saveLayoutParams(const graph::ForceDirectedLayout::LayoutParams& params) {
    auto format = [](float value) {
        std::ostringstream out;
        out << value;
        return out.str();
    };
    put(SettingKeys::kChargeStrength, format(params.charge_strength));
    put(SettingKeys::kCollisionRadiusMultiplier, format(params.collision_radius_multiplier));
}

AppConfig SettingsStore::loadConfig() {
    AppConfig config;
    try {
        config.theme = loadTheme();
        if (auto endpoint = loadNonEmpty(SettingKeys::kEndpointUrl)) {
            config.endpoint_url = *endpoint;
        }
        if (auto model = loadNonEmpty(SettingKeys::kModelId)) {
            config.model_id = *model;
        }
        config.layout_params = loadLayoutParams();
    } catch (const std::runtime_error& e) {
        std::cerr << "Warning: Failed to load settings from " << m_db_conn.getPath() << ": " << e.what()
                  << std::endl;
        config = AppConfig();
    }

    const char* env_endpoint = std::getenv(ENDPOINT_ENV_VAR);
    if (env_endpoint && env_endpoint[0] != '\0') {
        config.endpoint_url = env_endpoint;
    }
    return config;
}

void SettingsStore::saveConfig(const AppConfig& config) {
    m_db_conn.exec("BEGIN");
    try {
        saveTheme(config.theme);
        put(SettingKeys::kEndpointUrl, config.endpoint_url);
        put(SettingKeys::kModelId, config.model_id);
        saveLayoutParams(config.layout_params);
    } catch (const std::runtime_error&) {
        m_db_conn.exec("ROLLBACK");
        throw;
    }
    m_db_conn.exec("COMMIT");
}

} // namespace db
} // namespace relgraph
